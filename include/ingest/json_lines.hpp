#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <variant>

#include "core/manager.hpp"
#include "model/node_info.hpp"

namespace monitoring_server::ingest {

using InboundMessage = std::variant<model::NodeInfo, model::ContainerList>;

// One JSON object per line, discriminated by "type": "node_info" or
// "container_list". Throws std::invalid_argument on anything else.
InboundMessage parse_message(const std::string& line);

struct FeedStats {
  std::size_t lines_read{0};
  std::size_t node_infos{0};
  std::size_t container_lists{0};
  std::size_t malformed_lines{0};
  std::size_t dropped_messages{0};
};

// Transport adapter feeding the two inbound channels from a line stream.
class JsonLinesFeeder {
 public:
  JsonLinesFeeder(core::NodeInfoChannel& node_channel, core::ContainerListChannel& container_channel);

  // Reads until end of input or stop_requested(), then closes both channels.
  FeedStats run(std::istream& in, std::ostream& err, const std::function<bool()>& stop_requested = {});

 private:
  core::NodeInfoChannel& node_channel_;
  core::ContainerListChannel& container_channel_;
};

}  // namespace monitoring_server::ingest
