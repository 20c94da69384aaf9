#ifndef BLOCKWATCH_STORAGE_ROCKSDB_BATCH_HPP
#define BLOCKWATCH_STORAGE_ROCKSDB_BATCH_HPP

#include <rocksdb/write_batch.h>
#include "storage/rocksdb/rocksdb.hpp"

namespace blockwatch::storage
{

    /**
     * @brief Operations staged in a rocksdb WriteBatch, applied by commit in
     * one atomic write. An empty batch commits without touching the database.
     */
    class rocksdb::Batch : public WriteBatch
    {
    public:
        explicit Batch( rocksdb &db );

        outcome::result<void> put( const std::string &key, const std::string &value ) override;

        outcome::result<void> remove( const std::string &key ) override;

        outcome::result<void> commit() override;

        void clear() override;

    private:
        rocksdb                        &db_;
        ::ROCKSDB_NAMESPACE::WriteBatch batch_;
    };

} // namespace blockwatch::storage

#endif // BLOCKWATCH_STORAGE_ROCKSDB_BATCH_HPP
