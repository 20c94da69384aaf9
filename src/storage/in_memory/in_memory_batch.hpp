#ifndef BLOCKWATCH_STORAGE_IN_MEMORY_BATCH_HPP
#define BLOCKWATCH_STORAGE_IN_MEMORY_BATCH_HPP

#include <optional>

#include "storage/in_memory/in_memory_storage.hpp"

namespace blockwatch::storage {

  class InMemoryBatch : public WriteBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const std::string &key,
                              const std::string &value) override {
      entries[key] = value;
      return outcome::success();
    }

    outcome::result<void> remove(const std::string &key) override {
      entries[key] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      OUTCOME_TRY(db.apply(entries));
      entries.clear();
      return outcome::success();
    }

    void clear() override {
      entries.clear();
    }

   private:
    std::map<std::string, std::optional<std::string>> entries;
    InMemoryStorage &db;
  };
}  // namespace blockwatch::storage

#endif  // BLOCKWATCH_STORAGE_IN_MEMORY_BATCH_HPP
