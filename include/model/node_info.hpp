#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace monitoring_server::model {

// Latest utilization sample reported by one node. Memory is in KB.
struct NodeInfo {
  std::string node_name{};
  std::string ip{};
  double cpu_usage{0.0};
  std::uint64_t cpu_count{0};
  std::uint64_t gpu_count{0};
  std::uint64_t used_memory{0};
  std::uint64_t total_memory{0};
  double mem_usage{0.0};
  std::uint64_t rx_bytes{0};
  std::uint64_t tx_bytes{0};
  std::uint64_t read_bytes{0};
  std::uint64_t write_bytes{0};
  std::string os{};
  std::string arch{};
};

struct ContainerInfo {
  std::string id{};
  std::vector<std::string> names{};
  std::string image{};
};

// Container inventory of one node. Observed only.
struct ContainerList {
  std::string node_name{};
  std::vector<ContainerInfo> containers{};
};

}  // namespace monitoring_server::model
