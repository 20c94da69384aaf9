#ifndef BLOCKWATCH_STORAGE_WRITE_BATCH_HPP
#define BLOCKWATCH_STORAGE_WRITE_BATCH_HPP

#include <string>

#include "outcome/outcome.hpp"

namespace blockwatch::storage {

  /**
   * @brief An abstraction over a storage, which can be used for batch writes.
   * Either every operation of the batch is applied or none of them.
   */
  struct WriteBatch {
    virtual ~WriteBatch() = default;

    /**
     * @brief Store value by key
     * @param key key
     * @param value value
     */
    virtual outcome::result<void> put(const std::string &key,
                                      const std::string &value) = 0;

    /**
     * @brief Remove value by key
     * @param key key
     */
    virtual outcome::result<void> remove(const std::string &key) = 0;

    /**
     * @brief Writes batch.
     * @return error code in case of error.
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Clear batch.
     */
    virtual void clear() = 0;
  };

}  // namespace blockwatch::storage

#endif  // BLOCKWATCH_STORAGE_WRITE_BATCH_HPP
