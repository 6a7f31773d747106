#include "model/aggregates.hpp"

#include <algorithm>

namespace monitoring_server::model {

AggregateTotals compute_totals(const std::vector<NodeInfo>& nodes) noexcept {
  AggregateTotals totals{};
  if (nodes.empty()) {
    return totals;
  }

  double cpu_usage_sum = 0.0;
  double mem_usage_sum = 0.0;
  for (const auto& node : nodes) {
    cpu_usage_sum += node.cpu_usage;
    mem_usage_sum += node.mem_usage;
    totals.total_cpu_count += node.cpu_count;
    totals.total_gpu_count += node.gpu_count;
    totals.total_used_memory += node.used_memory;
    totals.total_memory += node.total_memory;
    totals.total_rx_bytes += node.rx_bytes;
    totals.total_tx_bytes += node.tx_bytes;
    totals.total_read_bytes += node.read_bytes;
    totals.total_write_bytes += node.write_bytes;
  }

  const auto count = static_cast<double>(nodes.size());
  totals.total_cpu_usage = cpu_usage_sum / count;
  totals.total_mem_usage = mem_usage_sum / count;
  return totals;
}

void upsert_member(std::vector<NodeInfo>& nodes, const NodeInfo& node) {
  const auto it = std::find_if(nodes.begin(), nodes.end(),
                               [&node](const NodeInfo& member) { return member.node_name == node.node_name; });
  if (it != nodes.end()) {
    *it = node;
    return;
  }
  nodes.push_back(node);
}

bool erase_member(std::vector<NodeInfo>& nodes, const std::string& node_name) {
  const auto it = std::find_if(nodes.begin(), nodes.end(),
                               [&node_name](const NodeInfo& member) { return member.node_name == node_name; });
  if (it == nodes.end()) {
    return false;
  }
  nodes.erase(it);
  return true;
}

}  // namespace monitoring_server::model
