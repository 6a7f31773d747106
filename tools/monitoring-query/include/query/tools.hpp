#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "storage/monitoring_repository.hpp"

namespace monitoring_server::query {

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

// Handlers read through repository, which must outlive the registry.
ToolRegistry build_tool_registry(storage::MonitoringRepository& repository);

}  // namespace monitoring_server::query
