#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "model/aggregates.hpp"
#include "model/node_info.hpp"
#include "storage/kv_store.hpp"

namespace monitoring_server::storage {

constexpr const char* kNodesPrefix = "monitoring/nodes/";
constexpr const char* kSocsPrefix = "monitoring/socs/";
constexpr const char* kBoardsPrefix = "monitoring/boards/";

std::string node_key(const std::string& node_name);
std::string soc_key(const std::string& soc_id);
std::string board_key(const std::string& board_id);

// JSON documents for nodes, SoCs and boards under the monitoring/ key
// namespace. Backend failures surface as StorageError. Single lookups throw
// DeserializationError on a corrupt value; bulk listings log and skip it.
class MonitoringRepository {
 public:
  explicit MonitoringRepository(KvStore& backend);

  void store_node(const model::NodeInfo& node);
  void store_soc(const model::SocInfo& soc);
  void store_board(const model::BoardInfo& board);

  std::optional<model::NodeInfo> get_node(const std::string& node_name);
  std::optional<model::SocInfo> get_soc(const std::string& soc_id);
  std::optional<model::BoardInfo> get_board(const std::string& board_id);

  std::vector<model::NodeInfo> get_all_nodes();
  std::vector<model::SocInfo> get_all_socs();
  std::vector<model::BoardInfo> get_all_boards();

  void delete_node(const std::string& node_name);
  void delete_soc(const std::string& soc_id);
  void delete_board(const std::string& board_id);

  // Decode failures seen by bulk listings since construction.
  [[nodiscard]] std::size_t skipped_records() const noexcept { return skipped_records_; }

 private:
  template <typename T>
  void store(const std::string& key, const T& value, const char* kind, const std::string& id);

  template <typename T>
  std::optional<T> load(const std::string& key, const char* kind);

  template <typename T>
  std::vector<T> load_all(const char* prefix, const char* kind);

  KvStore& backend_;
  std::size_t skipped_records_{0};
};

}  // namespace monitoring_server::storage
