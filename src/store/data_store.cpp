#include "store/data_store.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"

namespace monitoring_server::store {

namespace {

template <typename Aggregate>
void recompute(Aggregate& aggregate, const std::uint64_t now_ns) {
  static_cast<model::AggregateTotals&>(aggregate) = model::compute_totals(aggregate.nodes);
  aggregate.last_updated = now_ns;
}

}  // namespace

derived::HierarchyId DataStore::upsert_node(const model::NodeInfo& node) {
  auto ids = derived::derive_hierarchy(node.ip);
  const std::uint64_t now_ns = core::unix_timestamp_now_ns();

  const auto existing = nodes_.find(node.node_name);
  if (existing != nodes_.end() && existing->second.ip != node.ip) {
    const auto previous_ids = derived::derive_hierarchy(existing->second.ip);
    if (previous_ids.soc_id != ids.soc_id || previous_ids.board_id != ids.board_id) {
      detach_member(previous_ids, node.node_name, now_ns);
    }
  }

  nodes_[node.node_name] = node;
  upsert_soc_member(ids.soc_id, node, now_ns);
  upsert_board_member(ids.board_id, node, now_ns);
  rebuild_board_socs(ids.board_id);
  return ids;
}

bool DataStore::remove_node(const std::string& node_name) {
  const auto it = nodes_.find(node_name);
  if (it == nodes_.end()) {
    return false;
  }

  const auto ids = derived::derive_hierarchy(it->second.ip);
  nodes_.erase(it);
  detach_member(ids, node_name, core::unix_timestamp_now_ns());
  return true;
}

const model::NodeInfo* DataStore::get_node(const std::string& node_name) const {
  const auto it = nodes_.find(node_name);
  return it != nodes_.end() ? &it->second : nullptr;
}

const model::SocInfo* DataStore::get_soc(const std::string& soc_id) const {
  const auto it = socs_.find(soc_id);
  return it != socs_.end() ? &it->second : nullptr;
}

const model::BoardInfo* DataStore::get_board(const std::string& board_id) const {
  const auto it = boards_.find(board_id);
  return it != boards_.end() ? &it->second : nullptr;
}

void DataStore::upsert_soc_member(const std::string& soc_id, const model::NodeInfo& node, const std::uint64_t now_ns) {
  auto& soc = socs_[soc_id];
  soc.soc_id = soc_id;
  model::upsert_member(soc.nodes, node);
  recompute(soc, now_ns);
}

void DataStore::upsert_board_member(const std::string& board_id, const model::NodeInfo& node,
                                    const std::uint64_t now_ns) {
  auto& board = boards_[board_id];
  board.board_id = board_id;
  model::upsert_member(board.nodes, node);
  recompute(board, now_ns);
}

void DataStore::detach_member(const derived::HierarchyId& ids, const std::string& node_name,
                              const std::uint64_t now_ns) {
  if (const auto soc = socs_.find(ids.soc_id); soc != socs_.end()) {
    model::erase_member(soc->second.nodes, node_name);
    if (soc->second.nodes.empty()) {
      socs_.erase(soc);
    } else {
      recompute(soc->second, now_ns);
    }
  }

  if (const auto board = boards_.find(ids.board_id); board != boards_.end()) {
    model::erase_member(board->second.nodes, node_name);
    if (board->second.nodes.empty()) {
      boards_.erase(board);
      return;
    }
    recompute(board->second, now_ns);
    rebuild_board_socs(ids.board_id);
  }
}

void DataStore::rebuild_board_socs(const std::string& board_id) {
  const auto board = boards_.find(board_id);
  if (board == boards_.end()) {
    return;
  }

  std::vector<model::SocInfo> socs;
  for (const auto& [soc_id, soc] : socs_) {
    const auto soc_octets = derived::try_parse_ipv4(soc_id);
    if (soc_octets.has_value() && derived::board_id_for(soc_id) == board_id) {
      socs.push_back(soc);
    }
  }
  std::sort(socs.begin(), socs.end(),
            [](const model::SocInfo& lhs, const model::SocInfo& rhs) { return lhs.soc_id < rhs.soc_id; });
  board->second.socs = std::move(socs);
}

}  // namespace monitoring_server::store
