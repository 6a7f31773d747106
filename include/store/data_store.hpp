#pragma once

#include <string>
#include <unordered_map>

#include "derived/hierarchy_id.hpp"
#include "model/aggregates.hpp"
#include "model/node_info.hpp"

namespace monitoring_server::store {

// Per-node records plus SoC and board rollups. Every mutation re-derives
// the affected aggregates from their member lists. Not thread-safe; the
// manager owns the only instance and serializes access.
class DataStore {
 public:
  using NodeMap = std::unordered_map<std::string, model::NodeInfo>;
  using SocMap = std::unordered_map<std::string, model::SocInfo>;
  using BoardMap = std::unordered_map<std::string, model::BoardInfo>;

  DataStore() = default;

  // Throws derived::InvalidAddress without touching any mapping.
  derived::HierarchyId upsert_node(const model::NodeInfo& node);

  // Returns false when no node with that name is stored.
  bool remove_node(const std::string& node_name);

  [[nodiscard]] const model::NodeInfo* get_node(const std::string& node_name) const;
  [[nodiscard]] const model::SocInfo* get_soc(const std::string& soc_id) const;
  [[nodiscard]] const model::BoardInfo* get_board(const std::string& board_id) const;

  [[nodiscard]] const NodeMap& all_nodes() const noexcept { return nodes_; }
  [[nodiscard]] const SocMap& all_socs() const noexcept { return socs_; }
  [[nodiscard]] const BoardMap& all_boards() const noexcept { return boards_; }

 private:
  void upsert_soc_member(const std::string& soc_id, const model::NodeInfo& node, std::uint64_t now_ns);
  void upsert_board_member(const std::string& board_id, const model::NodeInfo& node, std::uint64_t now_ns);
  void detach_member(const derived::HierarchyId& ids, const std::string& node_name, std::uint64_t now_ns);
  void rebuild_board_socs(const std::string& board_id);

  NodeMap nodes_{};
  SocMap socs_{};
  BoardMap boards_{};
};

}  // namespace monitoring_server::store
