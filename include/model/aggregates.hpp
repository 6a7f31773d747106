#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/node_info.hpp"

namespace monitoring_server::model {

// Derived totals shared by SoC and board aggregates. cpu/mem usage are
// member means, everything else is an exact sum.
struct AggregateTotals {
  double total_cpu_usage{0.0};
  std::uint64_t total_cpu_count{0};
  std::uint64_t total_gpu_count{0};
  std::uint64_t total_used_memory{0};
  std::uint64_t total_memory{0};
  double total_mem_usage{0.0};
  std::uint64_t total_rx_bytes{0};
  std::uint64_t total_tx_bytes{0};
  std::uint64_t total_read_bytes{0};
  std::uint64_t total_write_bytes{0};
};

struct SocInfo : AggregateTotals {
  std::string soc_id{};
  std::vector<NodeInfo> nodes{};
  std::uint64_t last_updated{0};  // unix ns
};

struct BoardInfo : AggregateTotals {
  std::string board_id{};
  std::vector<NodeInfo> nodes{};
  std::vector<SocInfo> socs{};  // ordered by soc_id
  std::uint64_t last_updated{0};  // unix ns
};

// Point-in-time copy of the whole store, each list ordered by key.
struct FleetSnapshot {
  std::vector<NodeInfo> nodes{};
  std::vector<SocInfo> socs{};
  std::vector<BoardInfo> boards{};
};

// Re-derives every total from the member list.
AggregateTotals compute_totals(const std::vector<NodeInfo>& nodes) noexcept;

// Replaces the member with the same node_name or appends a new one.
void upsert_member(std::vector<NodeInfo>& nodes, const NodeInfo& node);

// Returns true when a member named node_name was removed.
bool erase_member(std::vector<NodeInfo>& nodes, const std::string& node_name);

}  // namespace monitoring_server::model
