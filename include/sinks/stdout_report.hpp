#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "model/aggregates.hpp"
#include "model/node_info.hpp"

namespace monitoring_server::sinks {

struct FleetSummary {
  std::size_t node_count{0};
  std::size_t soc_count{0};
  std::size_t board_count{0};
  double avg_cpu_usage{0.0};
  double avg_mem_usage{0.0};
  std::uint64_t total_cpu_count{0};
  std::uint64_t total_gpu_count{0};
};

FleetSummary summarize_fleet(const model::FleetSnapshot& snapshot) noexcept;

std::string format_bytes(std::uint64_t bytes);
std::string format_memory(std::uint64_t kb);
std::string format_time_ago(std::uint64_t then_ns, std::uint64_t now_ns);

class StdoutReportSink {
 public:
  void publish_upsert(const model::NodeInfo& node, const model::SocInfo* soc, const model::BoardInfo* board) const;
  void publish_overview(const model::FleetSnapshot& snapshot) const;
};

}  // namespace monitoring_server::sinks
