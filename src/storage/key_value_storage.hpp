#ifndef BLOCKWATCH_STORAGE_KEY_VALUE_STORAGE_HPP
#define BLOCKWATCH_STORAGE_KEY_VALUE_STORAGE_HPP

#include <map>
#include <memory>
#include <string>

#include "outcome/outcome.hpp"
#include "storage/write_batch.hpp"

namespace blockwatch::storage {

  /**
   * @brief An abstraction over a readable, writeable key-value map with
   * batching and prefix lookups. Keys and values are arbitrary byte strings.
   */
  class KeyValueStorage {
   public:
    using QueryResult = std::map<std::string, std::string>;

    virtual ~KeyValueStorage() = default;

    /**
     * @brief Get value by key
     * @param key key
     * @return value or DatabaseError::NOT_FOUND
     */
    virtual outcome::result<std::string> get(const std::string &key) const = 0;

    /**
     * @brief Returns true if given key-value binding exists in the storage.
     */
    virtual bool contains(const std::string &key) const = 0;

    /**
     * @brief Returns true if the storage is empty.
     */
    virtual bool empty() const = 0;

    virtual outcome::result<void> put(const std::string &key,
                                      const std::string &value) = 0;

    virtual outcome::result<void> remove(const std::string &key) = 0;

    /**
     * @brief Creates new Write Batch - an object, which can be used to
     * efficiently write bulk data.
     */
    virtual std::unique_ptr<WriteBatch> batch() = 0;

    /**
     * @brief Every binding whose key starts with the prefix, ordered by key
     */
    virtual outcome::result<QueryResult> query(
        const std::string &key_prefix) const = 0;
  };

}  // namespace blockwatch::storage

#endif  // BLOCKWATCH_STORAGE_KEY_VALUE_STORAGE_HPP
