#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/channel.hpp"
#include "derived/hierarchy_id.hpp"
#include "model/aggregates.hpp"
#include "model/node_info.hpp"
#include "sinks/stdout_report.hpp"
#include "storage/kv_store.hpp"
#include "storage/monitoring_repository.hpp"
#include "store/data_store.hpp"

namespace monitoring_server::core {

using NodeInfoChannel = BoundedChannel<model::NodeInfo>;
using ContainerListChannel = BoundedChannel<model::ContainerList>;

struct ManagerStats {
  std::size_t node_infos_received{0};
  std::size_t node_infos_stored{0};
  std::size_t invalid_addresses{0};
  std::size_t container_lists_received{0};
  std::size_t persistence_failures{0};
};

// Owns the only DataStore. Every read and write goes through store_mutex_,
// so readers only ever observe the result of a completed upsert.
class MonitoringManager {
 public:
  explicit MonitoringManager(std::unique_ptr<storage::KvStore> persistence = nullptr, bool stdout_report = false);

  MonitoringManager(const MonitoringManager&) = delete;
  MonitoringManager& operator=(const MonitoringManager&) = delete;

  // One upsert under the store lock, then best-effort persistence.
  // Returns false when the sample carries a malformed address.
  bool handle_node_info(const model::NodeInfo& node);

  // Inventory is logged and counted; the store is never touched.
  void handle_container_list(const model::ContainerList& list);

  bool remove_node(const std::string& node_name);

  // Each loop returns once its channel is closed and drained.
  void process_node_info_requests(NodeInfoChannel& channel);
  void process_container_requests(ContainerListChannel& channel);

  // Runs both loops on their own threads until both channels close.
  void run(NodeInfoChannel& node_channel, ContainerListChannel& container_channel);

  [[nodiscard]] std::optional<model::NodeInfo> get_node(const std::string& node_name) const;
  [[nodiscard]] std::optional<model::SocInfo> get_soc(const std::string& soc_id) const;
  [[nodiscard]] std::optional<model::BoardInfo> get_board(const std::string& board_id) const;

  [[nodiscard]] std::vector<model::NodeInfo> all_nodes() const;
  [[nodiscard]] std::vector<model::SocInfo> all_socs() const;
  [[nodiscard]] std::vector<model::BoardInfo> all_boards() const;
  [[nodiscard]] model::FleetSnapshot snapshot() const;

  [[nodiscard]] ManagerStats stats() const noexcept;

 private:
  void persist_locked(const model::NodeInfo* node, const std::string& node_name,
                      const std::vector<derived::HierarchyId>& touched);
  void note_persistence_result(bool ok, const std::string& detail);

  mutable std::mutex store_mutex_;
  store::DataStore store_{};
  std::unique_ptr<storage::KvStore> persistence_backend_;
  std::unique_ptr<storage::MonitoringRepository> repository_;
  sinks::StdoutReportSink report_sink_{};
  bool stdout_report_{false};
  bool persistence_was_ok_{true};

  std::atomic<std::size_t> node_infos_received_{0};
  std::atomic<std::size_t> node_infos_stored_{0};
  std::atomic<std::size_t> invalid_addresses_{0};
  std::atomic<std::size_t> container_lists_received_{0};
  std::atomic<std::size_t> persistence_failures_{0};
};

}  // namespace monitoring_server::core
