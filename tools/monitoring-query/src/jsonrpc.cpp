#include "query/jsonrpc.hpp"

#include <utility>

namespace monitoring_server::query {

namespace {

const nlohmann::json* member(const nlohmann::json& object, const char* name) {
  const auto it = object.find(name);
  return it == object.end() ? nullptr : &*it;
}

[[noreturn]] void reject(const std::string& message) {
  throw RpcError(kInvalidRequest, message);
}

}  // namespace

RpcError::RpcError(const int code, const std::string& message, nlohmann::json data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {}

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    reject("request must be a JSON object");
  }

  const auto* version = member(request, "jsonrpc");
  if (version == nullptr || *version != kJsonRpcVersion) {
    reject("jsonrpc must be \"2.0\"");
  }

  JsonRpcRequest parsed{};
  if (const auto* id = member(request, "id"); id != nullptr) {
    if (!id->is_null() && !id->is_string() && !id->is_number_integer()) {
      reject("id must be a string, an integer or null");
    }
    parsed.id = *id;
  }

  const auto* method = member(request, "method");
  if (method == nullptr || !method->is_string()) {
    reject("method must be a string");
  }
  parsed.method = method->get<std::string>();

  // Positional params are not used by any fleet method.
  if (const auto* params = member(request, "params"); params != nullptr) {
    if (!params->is_object()) {
      reject("params must be an object");
    }
    parsed.params = *params;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const RpcError& error) {
  nlohmann::json body{{"code", error.code()}, {"message", error.what()}};
  if (!error.data().is_null()) {
    body["data"] = error.data();
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", std::move(body)}};
}

}  // namespace monitoring_server::query
