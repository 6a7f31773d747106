#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/kv_store.hpp"

struct redisContext;
struct redisReply;

namespace monitoring_server::storage {

struct RedisOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
};

// KvStore over plain Redis strings (SET/GET/DEL, SCAN+MGET for prefixes).
// Connects lazily and retries a failed command once after reconnecting.
// Not thread-safe.
class RedisKvStore final : public KvStore {
 public:
  explicit RedisKvStore(RedisOptions options = {});
  ~RedisKvStore() override;

  RedisKvStore(const RedisKvStore&) = delete;
  RedisKvStore& operator=(const RedisKvStore&) = delete;

  bool check_connectivity();
  [[nodiscard]] std::string endpoint() const;

  void put(const std::string& key, const std::string& value) override;
  std::optional<std::string> get(const std::string& key) override;
  std::vector<KeyValue> list_by_prefix(const std::string& prefix) override;
  void remove(const std::string& key) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  ReplyPtr execute(const std::vector<std::string>& args);
  ReplyPtr execute_once(const std::vector<std::string>& args);

  RedisOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace monitoring_server::storage
