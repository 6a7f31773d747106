#include "query/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "derived/hierarchy_id.hpp"
#include "storage/kv_store.hpp"

namespace monitoring_server::query {

Server::Server(ToolRegistry tools) : tools_(std::move(tools)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    nlohmann::json response;
    try {
      response = handle_request(nlohmann::json::parse(line));
    } catch (const nlohmann::json::parse_error& ex) {
      err << "[query] unparsable request: " << ex.what() << '\n';
      response = make_error_response(nullptr, RpcError(kParseError, "parse error"));
    }

    if (!response.is_null()) {
      out << response.dump() << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request) const {
  JsonRpcRequest parsed;
  try {
    parsed = parse_request(request);
  } catch (const RpcError& ex) {
    return make_error_response(nullptr, ex);
  }

  const nlohmann::json id = parsed.id.value_or(nullptr);
  nlohmann::json response;
  try {
    response = make_result_response(id, dispatch(parsed));
  } catch (const RpcError& ex) {
    response = make_error_response(id, ex);
  } catch (const derived::InvalidAddress& ex) {
    response = make_error_response(id, RpcError(kInvalidParams, ex.what(), {{"address", ex.address()}}));
  } catch (const std::invalid_argument& ex) {
    response = make_error_response(id, RpcError(kInvalidParams, ex.what()));
  } catch (const storage::StorageError& ex) {
    std::cerr << "[query] storage error in " << parsed.method << ": " << ex.what() << '\n';
    response = make_error_response(id, RpcError(kStorageError, ex.what()));
  } catch (const std::exception& ex) {
    std::cerr << "[query] failed to process " << parsed.method << ": " << ex.what() << '\n';
    response = make_error_response(id, RpcError(kInternalError, "internal error"));
  }

  if (parsed.is_notification()) {
    return nullptr;
  }
  return response;
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) const {
  if (request.method == "initialize") {
    return nlohmann::json{{"serverInfo", {{"name", "monitoring-query"}, {"version", "0.1.0"}}},
                          {"capabilities", {{"tools", nlohmann::json::object()}}}};
  }
  if (request.method == "tools/list") {
    return list_tools();
  }
  if (request.method == "tools/call") {
    return call_tool(request.params);
  }
  throw RpcError(kMethodNotFound, "method not found", {{"method", request.method}});
}

nlohmann::json Server::list_tools() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::call_tool(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw RpcError(kInvalidParams, "name must be a string");
  }
  const auto name = name_it->get<std::string>();

  const auto tool_it = tools_.find(name);
  if (tool_it == tools_.end()) {
    throw RpcError(kInvalidParams, "unknown tool", {{"tool", name}});
  }

  const auto args_it = params.find("arguments");
  if (args_it == params.end()) {
    return nlohmann::json{{"content", tool_it->second.handler(nlohmann::json::object())}};
  }
  if (!args_it->is_object()) {
    throw RpcError(kInvalidParams, "arguments must be an object", {{"tool", name}});
  }
  return nlohmann::json{{"content", tool_it->second.handler(*args_it)}};
}

}  // namespace monitoring_server::query
