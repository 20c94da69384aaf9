#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_batch.hpp"

namespace blockwatch::storage {

  outcome::result<std::string> InMemoryStorage::get(
      const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      return it->second;
    }

    return DatabaseError::NOT_FOUND;
  }

  bool InMemoryStorage::contains(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.find(key) != storage_.end();
  }

  bool InMemoryStorage::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.empty();
  }

  outcome::result<void> InMemoryStorage::put(const std::string &key,
                                             const std::string &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage_[key] = value;
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage_.erase(key);
    return outcome::success();
  }

  std::unique_ptr<WriteBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  outcome::result<KeyValueStorage::QueryResult> InMemoryStorage::query(
      const std::string &key_prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueryResult results;
    for (auto it = storage_.lower_bound(key_prefix);
         it != storage_.end()
         && it->first.compare(0, key_prefix.size(), key_prefix) == 0;
         ++it) {
      results.emplace(it->first, it->second);
    }
    return results;
  }

  outcome::result<void> InMemoryStorage::apply(
      const std::map<std::string, std::optional<std::string>> &entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, value] : entries) {
      if (value) {
        storage_[key] = *value;
      } else {
        storage_.erase(key);
      }
    }
    return outcome::success();
  }
}  // namespace blockwatch::storage
