#include "storage/monitoring_repository.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "storage/json_codec.hpp"

namespace monitoring_server::storage {

std::string node_key(const std::string& node_name) { return kNodesPrefix + node_name; }

std::string soc_key(const std::string& soc_id) { return kSocsPrefix + soc_id; }

std::string board_key(const std::string& board_id) { return kBoardsPrefix + board_id; }

MonitoringRepository::MonitoringRepository(KvStore& backend) : backend_(backend) {}

template <typename T>
void MonitoringRepository::store(const std::string& key, const T& value, const char* kind, const std::string& id) {
  std::string payload;
  try {
    payload = nlohmann::json(value).dump();
  } catch (const nlohmann::json::exception& ex) {
    throw SerializationError(std::string("failed to serialize ") + kind + " " + id + ": " + ex.what());
  }

  backend_.put(key, payload);
  std::cerr << "[storage] stored " << kind << " " << id << '\n';
}

template <typename T>
std::optional<T> MonitoringRepository::load(const std::string& key, const char* kind) {
  const auto payload = backend_.get(key);
  if (!payload.has_value()) {
    return std::nullopt;
  }

  try {
    return nlohmann::json::parse(*payload).get<T>();
  } catch (const nlohmann::json::exception& ex) {
    throw DeserializationError(std::string("failed to deserialize ") + kind + " " + key + ": " + ex.what());
  }
}

template <typename T>
std::vector<T> MonitoringRepository::load_all(const char* prefix, const char* kind) {
  const auto entries = backend_.list_by_prefix(prefix);

  std::vector<T> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    try {
      out.push_back(nlohmann::json::parse(entry.value).get<T>());
    } catch (const nlohmann::json::exception& ex) {
      ++skipped_records_;
      std::cerr << "[storage] failed to deserialize " << kind << " " << entry.key << ": " << ex.what() << '\n';
    }
  }
  return out;
}

void MonitoringRepository::store_node(const model::NodeInfo& node) {
  store(node_key(node.node_name), node, "node", node.node_name);
}

void MonitoringRepository::store_soc(const model::SocInfo& soc) {
  store(soc_key(soc.soc_id), soc, "soc", soc.soc_id);
}

void MonitoringRepository::store_board(const model::BoardInfo& board) {
  store(board_key(board.board_id), board, "board", board.board_id);
}

std::optional<model::NodeInfo> MonitoringRepository::get_node(const std::string& node_name) {
  return load<model::NodeInfo>(node_key(node_name), "node");
}

std::optional<model::SocInfo> MonitoringRepository::get_soc(const std::string& soc_id) {
  return load<model::SocInfo>(soc_key(soc_id), "soc");
}

std::optional<model::BoardInfo> MonitoringRepository::get_board(const std::string& board_id) {
  return load<model::BoardInfo>(board_key(board_id), "board");
}

std::vector<model::NodeInfo> MonitoringRepository::get_all_nodes() {
  return load_all<model::NodeInfo>(kNodesPrefix, "node");
}

std::vector<model::SocInfo> MonitoringRepository::get_all_socs() {
  return load_all<model::SocInfo>(kSocsPrefix, "soc");
}

std::vector<model::BoardInfo> MonitoringRepository::get_all_boards() {
  return load_all<model::BoardInfo>(kBoardsPrefix, "board");
}

void MonitoringRepository::delete_node(const std::string& node_name) {
  backend_.remove(node_key(node_name));
  std::cerr << "[storage] deleted node " << node_name << '\n';
}

void MonitoringRepository::delete_soc(const std::string& soc_id) {
  backend_.remove(soc_key(soc_id));
  std::cerr << "[storage] deleted soc " << soc_id << '\n';
}

void MonitoringRepository::delete_board(const std::string& board_id) {
  backend_.remove(board_key(board_id));
  std::cerr << "[storage] deleted board " << board_id << '\n';
}

}  // namespace monitoring_server::storage
