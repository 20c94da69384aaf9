#ifndef BLOCKWATCH_STORAGE_ROCKSDB_HPP
#define BLOCKWATCH_STORAGE_ROCKSDB_HPP

#include <rocksdb/rocksdb_namespace.h>
#include <rocksdb/db.h>
#include <rocksdb/slice.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include "base/logger.hpp"
#include "storage/key_value_storage.hpp"

namespace blockwatch::storage
{

    /**
     * @brief KeyValueStorage persisted in a RocksDB database. Every write is
     * synced to disk before it is acknowledged.
     */
    class rocksdb : public KeyValueStorage
    {
    public:
        class Batch;

        using Iterator     = ::ROCKSDB_NAMESPACE::Iterator;
        using Options      = ::ROCKSDB_NAMESPACE::Options;
        using ReadOptions  = ::ROCKSDB_NAMESPACE::ReadOptions;
        using WriteOptions = ::ROCKSDB_NAMESPACE::WriteOptions;
        using DB           = ::ROCKSDB_NAMESPACE::DB;
        using Status       = ::ROCKSDB_NAMESPACE::Status;
        using Slice        = ::ROCKSDB_NAMESPACE::Slice;

        ~rocksdb() override = default;

        /**
         * @brief Open the database at path, creating the directory and the
         * database if missing
         * @param options base rocksdb options, create_if_missing is forced
         * @return opened database or the DatabaseError of the failed open
         */
        static outcome::result<std::shared_ptr<rocksdb>> create( std::string_view path, const Options &options = Options() );

        std::unique_ptr<WriteBatch> batch() override;

        outcome::result<std::string> get( const std::string &key ) const override;

        outcome::result<QueryResult> query( const std::string &key_prefix ) const override;

        [[nodiscard]] bool contains( const std::string &key ) const override;

        bool empty() const override;

        outcome::result<void> put( const std::string &key, const std::string &value ) override;

        outcome::result<void> remove( const std::string &key ) override;

    private:
        rocksdb() = default;

        std::unique_ptr<DB> db_;
        ReadOptions         ro_;
        WriteOptions        wo_;
        base::Logger        logger_;
    };

} // namespace blockwatch::storage

#endif // BLOCKWATCH_STORAGE_ROCKSDB_HPP
