#include "query/tools.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "derived/hierarchy_id.hpp"
#include "sinks/stdout_report.hpp"
#include "storage/json_codec.hpp"

namespace monitoring_server::query {

namespace {

nlohmann::json empty_schema() {
  return nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}, {"additionalProperties", false}};
}

nlohmann::json string_arg_schema(const char* name) {
  return nlohmann::json{{"type", "object"},
                        {"properties", {{name, {{"type", "string"}}}}},
                        {"required", {name}},
                        {"additionalProperties", false}};
}

std::string require_string(const nlohmann::json& params, const char* name) {
  const auto it = params.find(name);
  if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument(std::string(name) + " must be a non-empty string");
  }
  return it->get<std::string>();
}

template <typename T>
nlohmann::json found_or_null(const std::optional<T>& value) {
  if (!value.has_value()) {
    return nlohmann::json{{"found", false}};
  }
  return nlohmann::json{{"found", true}, {"value", *value}};
}

}  // namespace

ToolRegistry build_tool_registry(storage::MonitoringRepository& repository) {
  ToolRegistry registry;
  const auto add = [&registry](Tool tool) { registry.emplace(tool.name, std::move(tool)); };

  add(Tool{"fleet.nodes.list", "List every persisted node record.", empty_schema(),
           [&repository](const nlohmann::json&) { return nlohmann::json{{"nodes", repository.get_all_nodes()}}; }});

  add(Tool{"fleet.socs.list", "List every persisted SoC aggregate.", empty_schema(),
           [&repository](const nlohmann::json&) { return nlohmann::json{{"socs", repository.get_all_socs()}}; }});

  add(Tool{"fleet.boards.list", "List every persisted board aggregate.", empty_schema(),
           [&repository](const nlohmann::json&) { return nlohmann::json{{"boards", repository.get_all_boards()}}; }});

  add(Tool{"fleet.node.get", "Fetch one node record by name.", string_arg_schema("node_name"),
           [&repository](const nlohmann::json& params) {
             return found_or_null(repository.get_node(require_string(params, "node_name")));
           }});

  add(Tool{"fleet.soc.get", "Fetch one SoC aggregate by id.", string_arg_schema("soc_id"),
           [&repository](const nlohmann::json& params) {
             return found_or_null(repository.get_soc(require_string(params, "soc_id")));
           }});

  add(Tool{"fleet.board.get", "Fetch one board aggregate by id.", string_arg_schema("board_id"),
           [&repository](const nlohmann::json& params) {
             return found_or_null(repository.get_board(require_string(params, "board_id")));
           }});

  add(Tool{"fleet.hierarchy.resolve", "Derive the SoC and board ids an IPv4 address belongs to.",
           string_arg_schema("ip"), [](const nlohmann::json& params) {
             const auto ip = require_string(params, "ip");
             const auto ids = derived::derive_hierarchy(ip);
             return nlohmann::json{{"ip", ip}, {"soc_id", ids.soc_id}, {"board_id", ids.board_id}};
           }});

  add(Tool{"fleet.summary", "Fleet-wide counts and averages over the persisted records.", empty_schema(),
           [&repository](const nlohmann::json&) {
             model::FleetSnapshot snapshot{repository.get_all_nodes(), repository.get_all_socs(),
                                           repository.get_all_boards()};
             const auto summary = sinks::summarize_fleet(snapshot);
             return nlohmann::json{{"node_count", summary.node_count},
                                   {"soc_count", summary.soc_count},
                                   {"board_count", summary.board_count},
                                   {"avg_cpu_usage", summary.avg_cpu_usage},
                                   {"avg_mem_usage", summary.avg_mem_usage},
                                   {"total_cpu_count", summary.total_cpu_count},
                                   {"total_gpu_count", summary.total_gpu_count},
                                   {"skipped_records", repository.skipped_records()}};
           }});

  return registry;
}

}  // namespace monitoring_server::query
