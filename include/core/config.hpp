#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace monitoring_server::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
  bool enabled{false};
};

struct ServerConfig {
  std::size_t queue_capacity{1024};
  bool stdout_report{true};
  bool summary_on_exit{true};
  RedisConfig redis{};
};

ServerConfig load_server_config(const std::string& path);

}  // namespace monitoring_server::core
