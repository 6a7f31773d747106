#include "storage/json_codec.hpp"

#include <string>

namespace monitoring_server::model {

namespace {

void totals_to_json(nlohmann::json& out, const AggregateTotals& totals) {
  out["total_cpu_usage"] = totals.total_cpu_usage;
  out["total_cpu_count"] = totals.total_cpu_count;
  out["total_gpu_count"] = totals.total_gpu_count;
  out["total_used_memory"] = totals.total_used_memory;
  out["total_memory"] = totals.total_memory;
  out["total_mem_usage"] = totals.total_mem_usage;
  out["total_rx_bytes"] = totals.total_rx_bytes;
  out["total_tx_bytes"] = totals.total_tx_bytes;
  out["total_read_bytes"] = totals.total_read_bytes;
  out["total_write_bytes"] = totals.total_write_bytes;
}

void totals_from_json(const nlohmann::json& in, AggregateTotals& totals) {
  in.at("total_cpu_usage").get_to(totals.total_cpu_usage);
  in.at("total_cpu_count").get_to(totals.total_cpu_count);
  in.at("total_gpu_count").get_to(totals.total_gpu_count);
  in.at("total_used_memory").get_to(totals.total_used_memory);
  in.at("total_memory").get_to(totals.total_memory);
  in.at("total_mem_usage").get_to(totals.total_mem_usage);
  in.at("total_rx_bytes").get_to(totals.total_rx_bytes);
  in.at("total_tx_bytes").get_to(totals.total_tx_bytes);
  in.at("total_read_bytes").get_to(totals.total_read_bytes);
  in.at("total_write_bytes").get_to(totals.total_write_bytes);
}

}  // namespace

void to_json(nlohmann::json& out, const NodeInfo& node) {
  out = nlohmann::json{{"node_name", node.node_name},
                       {"ip", node.ip},
                       {"cpu_usage", node.cpu_usage},
                       {"cpu_count", node.cpu_count},
                       {"gpu_count", node.gpu_count},
                       {"used_memory", node.used_memory},
                       {"total_memory", node.total_memory},
                       {"mem_usage", node.mem_usage},
                       {"rx_bytes", node.rx_bytes},
                       {"tx_bytes", node.tx_bytes},
                       {"read_bytes", node.read_bytes},
                       {"write_bytes", node.write_bytes},
                       {"os", node.os},
                       {"arch", node.arch}};
}

// Only the identity is mandatory; absent metrics read as zero.
void from_json(const nlohmann::json& in, NodeInfo& node) {
  in.at("node_name").get_to(node.node_name);
  in.at("ip").get_to(node.ip);
  node.cpu_usage = in.value("cpu_usage", 0.0);
  node.cpu_count = in.value("cpu_count", std::uint64_t{0});
  node.gpu_count = in.value("gpu_count", std::uint64_t{0});
  node.used_memory = in.value("used_memory", std::uint64_t{0});
  node.total_memory = in.value("total_memory", std::uint64_t{0});
  node.mem_usage = in.value("mem_usage", 0.0);
  node.rx_bytes = in.value("rx_bytes", std::uint64_t{0});
  node.tx_bytes = in.value("tx_bytes", std::uint64_t{0});
  node.read_bytes = in.value("read_bytes", std::uint64_t{0});
  node.write_bytes = in.value("write_bytes", std::uint64_t{0});
  node.os = in.value("os", std::string{});
  node.arch = in.value("arch", std::string{});
}

void to_json(nlohmann::json& out, const ContainerInfo& container) {
  out = nlohmann::json{{"id", container.id}, {"names", container.names}, {"image", container.image}};
}

void from_json(const nlohmann::json& in, ContainerInfo& container) {
  in.at("id").get_to(container.id);
  container.names = in.value("names", std::vector<std::string>{});
  container.image = in.value("image", std::string{});
}

void to_json(nlohmann::json& out, const ContainerList& list) {
  out = nlohmann::json{{"node_name", list.node_name}, {"containers", list.containers}};
}

void from_json(const nlohmann::json& in, ContainerList& list) {
  in.at("node_name").get_to(list.node_name);
  list.containers = in.value("containers", std::vector<ContainerInfo>{});
}

void to_json(nlohmann::json& out, const SocInfo& soc) {
  out = nlohmann::json{{"soc_id", soc.soc_id}, {"nodes", soc.nodes}, {"last_updated", soc.last_updated}};
  totals_to_json(out, soc);
}

void from_json(const nlohmann::json& in, SocInfo& soc) {
  in.at("soc_id").get_to(soc.soc_id);
  in.at("nodes").get_to(soc.nodes);
  in.at("last_updated").get_to(soc.last_updated);
  totals_from_json(in, soc);
}

void to_json(nlohmann::json& out, const BoardInfo& board) {
  out = nlohmann::json{{"board_id", board.board_id},
                       {"nodes", board.nodes},
                       {"socs", board.socs},
                       {"last_updated", board.last_updated}};
  totals_to_json(out, board);
}

void from_json(const nlohmann::json& in, BoardInfo& board) {
  in.at("board_id").get_to(board.board_id);
  in.at("nodes").get_to(board.nodes);
  in.at("socs").get_to(board.socs);
  in.at("last_updated").get_to(board.last_updated);
  totals_from_json(in, board);
}

}  // namespace monitoring_server::model
