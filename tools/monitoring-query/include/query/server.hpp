#pragma once

#include <iosfwd>

#include <nlohmann/json.hpp>

#include "query/jsonrpc.hpp"
#include "query/tools.hpp"

namespace monitoring_server::query {

// Line-delimited JSON-RPC over a pair of streams. Malformed addresses and
// bad tool arguments surface as invalid params, backend failures as
// kStorageError.
class Server {
 public:
  explicit Server(ToolRegistry tools);

  // Returns when `in` is exhausted.
  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Null for notifications.
  nlohmann::json handle_request(const nlohmann::json& request) const;

 private:
  nlohmann::json dispatch(const JsonRpcRequest& request) const;
  nlohmann::json list_tools() const;
  nlohmann::json call_tool(const nlohmann::json& params) const;

  ToolRegistry tools_;
};

}  // namespace monitoring_server::query
