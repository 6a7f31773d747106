#include <pthread.h>
#include <signal.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/manager.hpp"
#include "ingest/json_lines.hpp"
#include "sinks/stdout_report.hpp"
#include "storage/redis_kv_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// No SA_RESTART: a pending stdin read returns so the feeder can stop.
void install_shutdown_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

std::string redis_endpoint(const monitoring_server::core::RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ":" + std::to_string(redis.port);
}

}  // namespace

std::string format_config_settings(const monitoring_server::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[server] loaded config from " << config_path
         << " | queue_capacity=" << config.queue_capacity
         << " | stdout_report=" << (config.stdout_report ? "true" : "false")
         << " | summary_on_exit=" << (config.summary_on_exit ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  if (config.redis.enabled) {
    output << " | redis_address=" << redis_endpoint(config.redis) << " | redis_db=" << config.redis.db;
  }
  return output.str();
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "configs/monitoring-server.yaml";

  monitoring_server::core::ServerConfig config{};
  try {
    config = monitoring_server::core::load_server_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<monitoring_server::storage::KvStore> persistence;
  if (config.redis.enabled) {
    monitoring_server::storage::RedisOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.connect_timeout_ms = config.redis.connect_timeout_ms;

    auto redis = std::make_unique<monitoring_server::storage::RedisKvStore>(options);
    if (redis->check_connectivity()) {
      std::cerr << "[server] redis connectivity confirmed at " << redis->endpoint() << '\n';
    } else {
      std::cerr << "[server] redis connectivity check failed at " << redis->endpoint()
                << "; will retry on every write\n";
    }
    persistence = std::move(redis);
  }

  monitoring_server::core::MonitoringManager manager(std::move(persistence), config.stdout_report);
  monitoring_server::core::NodeInfoChannel node_channel(config.queue_capacity);
  monitoring_server::core::ContainerListChannel container_channel(config.queue_capacity);

  // Worker threads inherit the blocked mask so the signal lands on the reader.
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);
  std::thread loops([&manager, &node_channel, &container_channel] { manager.run(node_channel, container_channel); });
  install_shutdown_handlers();
  pthread_sigmask(SIG_UNBLOCK, &shutdown_signals, nullptr);

  monitoring_server::ingest::JsonLinesFeeder feeder(node_channel, container_channel);
  const auto feed = feeder.run(std::cin, std::cerr, [] { return g_shutdown_requested != 0; });
  loops.join();

  if (g_shutdown_requested != 0) {
    std::cerr << "[server] shutdown signal received; exiting cleanly\n";
  }

  const auto stats = manager.stats();
  std::cerr << "[server] lines=" << feed.lines_read << " malformed=" << feed.malformed_lines
            << " node_infos=" << stats.node_infos_received << " stored=" << stats.node_infos_stored
            << " invalid_addresses=" << stats.invalid_addresses
            << " container_lists=" << stats.container_lists_received
            << " persistence_failures=" << stats.persistence_failures << '\n';

  if (config.summary_on_exit) {
    monitoring_server::sinks::StdoutReportSink{}.publish_overview(manager.snapshot());
  }

  return 0;
}
