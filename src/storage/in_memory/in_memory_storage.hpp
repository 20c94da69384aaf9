#ifndef BLOCKWATCH_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
#define BLOCKWATCH_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP

#include <mutex>
#include <optional>

#include "storage/key_value_storage.hpp"

namespace blockwatch::storage {

  /**
   * Simple storage that conforms KeyValueStorage interface
   * Used when no database path is configured and in tests to avoid
   * integration with RocksDB
   */
  class InMemoryStorage : public KeyValueStorage {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<std::string> get(const std::string &key) const override;

    bool contains(const std::string &key) const override;

    bool empty() const override;

    outcome::result<void> put(const std::string &key,
                              const std::string &value) override;

    outcome::result<void> remove(const std::string &key) override;

    std::unique_ptr<WriteBatch> batch() override;

    outcome::result<QueryResult> query(
        const std::string &key_prefix) const override;

   private:
    friend class InMemoryBatch;

    /// nullopt in the map stands for removal
    outcome::result<void> apply(
        const std::map<std::string, std::optional<std::string>> &entries);

    mutable std::mutex mutex_;
    std::map<std::string, std::string> storage_;
  };

}  // namespace blockwatch::storage

#endif  // BLOCKWATCH_STORAGE_IN_MEMORY_IN_MEMORY_STORAGE_HPP
