#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "query/server.hpp"
#include "query/tools.hpp"
#include "storage/monitoring_repository.hpp"
#include "storage/redis_kv_store.hpp"

namespace {

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

int getenv_or_int(const char* name, const int fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::stoi(value);
  }
  return fallback;
}

monitoring_server::storage::RedisOptions load_redis_options() {
  monitoring_server::storage::RedisOptions options{};
  options.host = getenv_or("MONITORING_REDIS_HOST", options.host);
  options.port = static_cast<std::uint16_t>(getenv_or_int("MONITORING_REDIS_PORT", options.port));
  options.unix_socket = getenv_or("MONITORING_REDIS_SOCKET", options.unix_socket);
  options.password = getenv_or("MONITORING_REDIS_PASSWORD", options.password);
  options.db = getenv_or_int("MONITORING_REDIS_DB", options.db);
  return options;
}

}  // namespace

int main() {
  monitoring_server::storage::RedisOptions options{};
  try {
    options = load_redis_options();
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  monitoring_server::storage::RedisKvStore backend(options);
  monitoring_server::storage::MonitoringRepository repository(backend);
  monitoring_server::query::Server server(monitoring_server::query::build_tool_registry(repository));
  return server.run(std::cin, std::cout, std::cerr);
}
