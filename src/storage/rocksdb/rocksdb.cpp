#include "storage/rocksdb/rocksdb.hpp"

#include <memory>
#include <utility>

#include <boost/filesystem.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace blockwatch::storage
{
    using BlockBasedTableOptions = ::ROCKSDB_NAMESPACE::BlockBasedTableOptions;

    outcome::result<std::shared_ptr<rocksdb>> rocksdb::create( std::string_view path, const Options &options )
    {
        boost::system::error_code ec;
        boost::filesystem::create_directories( std::string( path ), ec );
        if ( ec )
        {
            return DatabaseError::IO_ERROR;
        }

        // constructor is private, so make_shared is not available
        std::shared_ptr<rocksdb> l( new rocksdb() );

        Options db_options           = options;
        db_options.create_if_missing = true;

        // Set up bloom filter
        BlockBasedTableOptions table_options;
        table_options.filter_policy.reset( ::ROCKSDB_NAMESPACE::NewBloomFilterPolicy( 10, false ) );
        table_options.whole_key_filtering = true;
        db_options.table_factory.reset( NewBlockBasedTableFactory( table_options ) );
        db_options.info_log_level = ::ROCKSDB_NAMESPACE::InfoLogLevel::ERROR_LEVEL;

        l->logger_ = base::createLogger( "rocksdb" );

        DB  *db     = nullptr;
        auto status = DB::Open( db_options, std::string( path ), &db );
        if ( !status.ok() )
        {
            delete db;
            return error_as_result<std::shared_ptr<rocksdb>>( status, l->logger_ );
        }
        l->db_.reset( db );

        // cursors of the watcher must survive a crash right after a write
        l->wo_.sync = true;
        return l;
    }

    std::unique_ptr<WriteBatch> rocksdb::batch()
    {
        return std::make_unique<Batch>( *this );
    }

    outcome::result<std::string> rocksdb::get( const std::string &key ) const
    {
        std::string value;
        auto        status = db_->Get( ro_, make_slice( key ), &value );
        if ( status.ok() )
        {
            return value;
        }

        // not always an actual error so don't log it
        if ( status.IsNotFound() )
        {
            return error_as_result<std::string>( status );
        }

        return error_as_result<std::string>( status, logger_ );
    }

    outcome::result<KeyValueStorage::QueryResult> rocksdb::query( const std::string &key_prefix ) const
    {
        QueryResult results;
        auto        iter        = std::unique_ptr<Iterator>( db_->NewIterator( ro_ ) );
        auto        slicePrefix = make_slice( key_prefix );
        for ( iter->Seek( slicePrefix ); iter->Valid() && iter->key().starts_with( slicePrefix ); iter->Next() )
        {
            results.emplace( iter->key().ToString(), iter->value().ToString() );
        }
        if ( !iter->status().ok() )
        {
            return error_as_result<QueryResult>( iter->status(), logger_ );
        }
        return results;
    }

    bool rocksdb::contains( const std::string &key ) const
    {
        // here we interpret all kinds of errors as "not found".
        return get( key ).has_value();
    }

    bool rocksdb::empty() const
    {
        auto it = std::unique_ptr<Iterator>( db_->NewIterator( ro_ ) );
        it->SeekToFirst();
        return !it->Valid();
    }

    outcome::result<void> rocksdb::put( const std::string &key, const std::string &value )
    {
        auto status = db_->Put( wo_, make_slice( key ), make_slice( value ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

    outcome::result<void> rocksdb::remove( const std::string &key )
    {
        auto status = db_->Delete( wo_, make_slice( key ) );
        if ( status.ok() )
        {
            return outcome::success();
        }

        return error_as_result<void>( status, logger_ );
    }

} // namespace blockwatch::storage
