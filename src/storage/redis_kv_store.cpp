#include "storage/redis_kv_store.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>

#include <hiredis/hiredis.h>

namespace monitoring_server::storage {
namespace {

constexpr const char* kScanBatch = "256";
constexpr std::size_t kMgetBatch = 256;

std::string escape_glob(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 1);
  for (const char c : value) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

std::string reply_string(const redisReply* reply) {
  if (reply == nullptr || reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, reply->len);
}

}  // namespace

RedisKvStore::RedisKvStore(RedisOptions options) : options_(std::move(options)) {}

RedisKvStore::~RedisKvStore() = default;

void RedisKvStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisKvStore::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

bool RedisKvStore::check_connectivity() {
  return ensure_connected();
}

std::string RedisKvStore::endpoint() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ":" + std::to_string(options_.port);
}

bool RedisKvStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisKvStore::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect to " << endpoint() << " failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect to " << endpoint() << " failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisKvStore::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str())));
  if (reply == nullptr) {
    return false;
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[redis] AUTH rejected\n";
    return false;
  }
  return true;
}

bool RedisKvStore::select_db() {
  if (options_.db == 0) {
    return true;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)));
  if (reply == nullptr) {
    return false;
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
    return false;
  }
  return true;
}

RedisKvStore::ReplyPtr RedisKvStore::execute_once(const std::vector<std::string>& args) {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : args) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  return ReplyPtr(static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data())));
}

RedisKvStore::ReplyPtr RedisKvStore::execute(const std::vector<std::string>& args) {
  if (!ensure_connected()) {
    throw StorageError("redis unavailable at " + endpoint());
  }

  ReplyPtr reply = execute_once(args);
  if (reply == nullptr) {
    if (!reconnect()) {
      throw StorageError("redis " + args.front() + " failed: connection lost to " + endpoint());
    }
    reply = execute_once(args);
    if (reply == nullptr) {
      throw StorageError("redis " + args.front() + " failed after reconnect");
    }
  }

  if (reply->type == REDIS_REPLY_ERROR) {
    throw StorageError("redis " + args.front() + " rejected: " + reply_string(reply.get()));
  }
  return reply;
}

void RedisKvStore::put(const std::string& key, const std::string& value) {
  (void)execute({"SET", key, value});
}

std::optional<std::string> RedisKvStore::get(const std::string& key) {
  const ReplyPtr reply = execute({"GET", key});
  if (reply->type == REDIS_REPLY_NIL) {
    return std::nullopt;
  }
  if (reply->type != REDIS_REPLY_STRING) {
    throw StorageError("redis GET " + key + " returned a non-string reply");
  }
  return reply_string(reply.get());
}

std::vector<KeyValue> RedisKvStore::list_by_prefix(const std::string& prefix) {
  const std::string pattern = escape_glob(prefix) + "*";

  std::unordered_set<std::string> seen;
  std::vector<std::string> keys;
  std::string cursor = "0";
  do {
    const ReplyPtr reply = execute({"SCAN", cursor, "MATCH", pattern, "COUNT", kScanBatch});
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 || reply->element[1]->type != REDIS_REPLY_ARRAY) {
      throw StorageError("redis SCAN returned an unexpected reply");
    }

    cursor = reply_string(reply->element[0]);
    const redisReply* batch = reply->element[1];
    for (std::size_t i = 0; i < batch->elements; ++i) {
      std::string key = reply_string(batch->element[i]);
      if (key.compare(0, prefix.size(), prefix) == 0 && seen.insert(key).second) {
        keys.push_back(std::move(key));
      }
    }
  } while (cursor != "0" && !cursor.empty());

  std::sort(keys.begin(), keys.end());

  std::vector<KeyValue> out;
  out.reserve(keys.size());
  for (std::size_t offset = 0; offset < keys.size(); offset += kMgetBatch) {
    const std::size_t end = std::min(keys.size(), offset + kMgetBatch);
    std::vector<std::string> args{"MGET"};
    args.insert(args.end(), keys.begin() + static_cast<std::ptrdiff_t>(offset),
                keys.begin() + static_cast<std::ptrdiff_t>(end));

    const ReplyPtr reply = execute(args);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != end - offset) {
      throw StorageError("redis MGET returned an unexpected reply");
    }
    for (std::size_t i = 0; i < reply->elements; ++i) {
      // Key deleted between SCAN and MGET.
      if (reply->element[i]->type == REDIS_REPLY_NIL) {
        continue;
      }
      out.push_back(KeyValue{keys[offset + i], reply_string(reply->element[i])});
    }
  }
  return out;
}

void RedisKvStore::remove(const std::string& key) {
  (void)execute({"DEL", key});
}

}  // namespace monitoring_server::storage
