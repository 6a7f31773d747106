#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace monitoring_server::query {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kStorageError = -32000;

// A failure that is reported to the client as a JSON-RPC error object.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message, nlohmann::json data = nullptr);

  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] const nlohmann::json& data() const noexcept { return data_; }

 private:
  int code_;
  nlohmann::json data_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params = nlohmann::json::object();
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

// Throws RpcError with kInvalidRequest.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const RpcError& error);

}  // namespace monitoring_server::query
