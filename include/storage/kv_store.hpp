#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace monitoring_server::storage {

class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class SerializationError : public StorageError {
 public:
  using StorageError::StorageError;
};

class DeserializationError : public StorageError {
 public:
  using StorageError::StorageError;
};

struct KeyValue {
  std::string key;
  std::string value;
};

// Durable key-value backend. Implementations throw StorageError on
// transport or command failures; a missing key is not an error.
class KvStore {
 public:
  virtual void put(const std::string& key, const std::string& value) = 0;
  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual std::vector<KeyValue> list_by_prefix(const std::string& prefix) = 0;
  virtual void remove(const std::string& key) = 0;
  virtual ~KvStore() = default;
};

// Process-local backend, sorted by key. Safe to share between threads.
std::unique_ptr<KvStore> make_in_memory_kv_store();

}  // namespace monitoring_server::storage
