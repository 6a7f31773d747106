#include "storage/kv_store.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace monitoring_server::storage {
namespace {

class InMemoryKvStore final : public KvStore {
 public:
  void put(const std::string& key, const std::string& value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
  }

  std::optional<std::string> get(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<KeyValue> list_by_prefix(const std::string& prefix) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyValue> out;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) {
        break;
      }
      out.push_back(KeyValue{it->first, it->second});
    }
    return out;
  }

  void remove(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
  }

 private:
  std::mutex mutex_;
  std::map<std::string, std::string> entries_;
};

}  // namespace

std::unique_ptr<KvStore> make_in_memory_kv_store() { return std::make_unique<InMemoryKvStore>(); }

}  // namespace monitoring_server::storage
