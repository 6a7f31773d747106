#include "core/manager.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace monitoring_server::core {

namespace {

template <typename Map, typename Value = typename Map::mapped_type>
std::vector<Value> sorted_values(const Map& map) {
  std::vector<std::pair<std::string, const Value*>> entries;
  entries.reserve(map.size());
  for (const auto& [key, value] : map) {
    entries.emplace_back(key, &value);
  }
  std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::vector<Value> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    out.push_back(*entry.second);
  }
  return out;
}

template <typename T>
std::optional<T> copy_of(const T* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  return *value;
}

}  // namespace

MonitoringManager::MonitoringManager(std::unique_ptr<storage::KvStore> persistence, const bool stdout_report)
    : persistence_backend_(std::move(persistence)), stdout_report_(stdout_report) {
  if (persistence_backend_ != nullptr) {
    repository_ = std::make_unique<storage::MonitoringRepository>(*persistence_backend_);
  }
}

bool MonitoringManager::handle_node_info(const model::NodeInfo& node) {
  ++node_infos_received_;

  std::lock_guard<std::mutex> lock(store_mutex_);

  std::vector<derived::HierarchyId> touched;
  derived::HierarchyId ids;
  try {
    if (const auto* previous = store_.get_node(node.node_name); previous != nullptr && previous->ip != node.ip) {
      touched.push_back(derived::derive_hierarchy(previous->ip));
    }
    ids = store_.upsert_node(node);
  } catch (const derived::InvalidAddress& ex) {
    ++invalid_addresses_;
    std::cerr << "[manager] rejected node info from " << node.node_name << ": " << ex.what() << '\n';
    return false;
  }
  ++node_infos_stored_;
  touched.insert(touched.begin(), ids);

  const auto* stored = store_.get_node(node.node_name);
  if (stdout_report_) {
    report_sink_.publish_upsert(*stored, store_.get_soc(ids.soc_id), store_.get_board(ids.board_id));
  }
  persist_locked(stored, node.node_name, touched);
  return true;
}

void MonitoringManager::handle_container_list(const model::ContainerList& list) {
  ++container_lists_received_;

  std::ostringstream line;
  line << "[manager] container list from " << list.node_name << ": containers=" << list.containers.size() << '\n';
  for (const auto& container : list.containers) {
    line << "[manager]   id=" << container.id << " names=[";
    for (std::size_t i = 0; i < container.names.size(); ++i) {
      line << (i == 0 ? "" : ", ") << container.names[i];
    }
    line << "] image=" << container.image << '\n';
  }
  std::cerr << line.str();
}

bool MonitoringManager::remove_node(const std::string& node_name) {
  std::lock_guard<std::mutex> lock(store_mutex_);

  const auto* node = store_.get_node(node_name);
  if (node == nullptr) {
    return false;
  }

  const auto ids = derived::derive_hierarchy(node->ip);
  store_.remove_node(node_name);
  std::cerr << "[manager] removed node " << node_name << " from soc " << ids.soc_id << " and board " << ids.board_id
            << '\n';

  persist_locked(nullptr, node_name, {ids});
  return true;
}

void MonitoringManager::process_node_info_requests(NodeInfoChannel& channel) {
  try {
    while (auto node = channel.receive()) {
      (void)handle_node_info(*node);
    }
  } catch (const std::exception& ex) {
    std::cerr << "[manager] node info loop aborted: " << ex.what() << '\n';
    channel.close();
  }
}

void MonitoringManager::process_container_requests(ContainerListChannel& channel) {
  try {
    while (auto list = channel.receive()) {
      handle_container_list(*list);
    }
  } catch (const std::exception& ex) {
    std::cerr << "[manager] container loop aborted: " << ex.what() << '\n';
    channel.close();
  }
}

void MonitoringManager::run(NodeInfoChannel& node_channel, ContainerListChannel& container_channel) {
  std::thread container_thread([this, &container_channel] { process_container_requests(container_channel); });
  std::thread node_thread([this, &node_channel] { process_node_info_requests(node_channel); });

  container_thread.join();
  node_thread.join();
  std::cerr << "[manager] monitoring loops stopped\n";
}

std::optional<model::NodeInfo> MonitoringManager::get_node(const std::string& node_name) const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return copy_of(store_.get_node(node_name));
}

std::optional<model::SocInfo> MonitoringManager::get_soc(const std::string& soc_id) const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return copy_of(store_.get_soc(soc_id));
}

std::optional<model::BoardInfo> MonitoringManager::get_board(const std::string& board_id) const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return copy_of(store_.get_board(board_id));
}

std::vector<model::NodeInfo> MonitoringManager::all_nodes() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return sorted_values(store_.all_nodes());
}

std::vector<model::SocInfo> MonitoringManager::all_socs() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return sorted_values(store_.all_socs());
}

std::vector<model::BoardInfo> MonitoringManager::all_boards() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return sorted_values(store_.all_boards());
}

model::FleetSnapshot MonitoringManager::snapshot() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return model::FleetSnapshot{sorted_values(store_.all_nodes()), sorted_values(store_.all_socs()),
                              sorted_values(store_.all_boards())};
}

ManagerStats MonitoringManager::stats() const noexcept {
  ManagerStats stats{};
  stats.node_infos_received = node_infos_received_.load();
  stats.node_infos_stored = node_infos_stored_.load();
  stats.invalid_addresses = invalid_addresses_.load();
  stats.container_lists_received = container_lists_received_.load();
  stats.persistence_failures = persistence_failures_.load();
  return stats;
}

void MonitoringManager::persist_locked(const model::NodeInfo* node, const std::string& node_name,
                                       const std::vector<derived::HierarchyId>& touched) {
  if (repository_ == nullptr) {
    return;
  }

  try {
    if (node != nullptr) {
      repository_->store_node(*node);
    } else {
      repository_->delete_node(node_name);
    }

    // Aggregates that emptied out are gone from the store; drop their keys too.
    for (const auto& ids : touched) {
      if (const auto* soc = store_.get_soc(ids.soc_id); soc != nullptr) {
        repository_->store_soc(*soc);
      } else {
        repository_->delete_soc(ids.soc_id);
      }
      if (const auto* board = store_.get_board(ids.board_id); board != nullptr) {
        repository_->store_board(*board);
      } else {
        repository_->delete_board(ids.board_id);
      }
    }
    note_persistence_result(true, {});
  } catch (const storage::StorageError& ex) {
    note_persistence_result(false, ex.what());
  }
}

void MonitoringManager::note_persistence_result(const bool ok, const std::string& detail) {
  if (!ok) {
    ++persistence_failures_;
    if (persistence_was_ok_) {
      std::cerr << "[manager] persistence failed: " << detail << '\n';
      persistence_was_ok_ = false;
    }
    return;
  }

  if (!persistence_was_ok_) {
    std::cerr << "[manager] persistence recovered\n";
    persistence_was_ok_ = true;
  }
}

}  // namespace monitoring_server::core
