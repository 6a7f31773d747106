#include "ingest/json_lines.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "storage/json_codec.hpp"

namespace monitoring_server::ingest {

InboundMessage parse_message(const std::string& line) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("line is not valid JSON: ") + ex.what());
  }

  if (!message.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }

  const auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    throw std::invalid_argument("type must be a string");
  }

  try {
    const auto& type = type_it->get_ref<const std::string&>();
    if (type == "node_info") {
      auto node = message.get<model::NodeInfo>();
      if (node.node_name.empty()) {
        throw std::invalid_argument("node_name must not be empty");
      }
      return node;
    }
    if (type == "container_list") {
      return message.get<model::ContainerList>();
    }
  } catch (const nlohmann::json::exception& ex) {
    throw std::invalid_argument(std::string("malformed message fields: ") + ex.what());
  }

  throw std::invalid_argument("unknown message type: " + type_it->get<std::string>());
}

JsonLinesFeeder::JsonLinesFeeder(core::NodeInfoChannel& node_channel, core::ContainerListChannel& container_channel)
    : node_channel_(node_channel), container_channel_(container_channel) {}

FeedStats JsonLinesFeeder::run(std::istream& in, std::ostream& err, const std::function<bool()>& stop_requested) {
  FeedStats stats{};

  std::string line;
  while (!(stop_requested && stop_requested()) && std::getline(in, line)) {
    ++stats.lines_read;
    if (line.empty()) {
      continue;
    }

    InboundMessage message;
    try {
      message = parse_message(line);
    } catch (const std::invalid_argument& ex) {
      ++stats.malformed_lines;
      err << "[ingest] skipping line " << stats.lines_read << ": " << ex.what() << '\n';
      continue;
    }

    bool accepted = false;
    if (auto* node = std::get_if<model::NodeInfo>(&message)) {
      accepted = node_channel_.send(std::move(*node));
      stats.node_infos += accepted ? 1U : 0U;
    } else {
      accepted = container_channel_.send(std::move(std::get<model::ContainerList>(message)));
      stats.container_lists += accepted ? 1U : 0U;
    }

    if (!accepted) {
      ++stats.dropped_messages;
      err << "[ingest] channel closed; stopping at line " << stats.lines_read << '\n';
      break;
    }
  }

  node_channel_.close();
  container_channel_.close();
  return stats;
}

}  // namespace monitoring_server::ingest
