#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace blockwatch::storage
{

    rocksdb::Batch::Batch( rocksdb &db ) : db_( db ) {}

    outcome::result<void> rocksdb::Batch::put( const std::string &key, const std::string &value )
    {
        batch_.Put( make_slice( key ), make_slice( value ) );
        return outcome::success();
    }

    outcome::result<void> rocksdb::Batch::remove( const std::string &key )
    {
        batch_.Delete( make_slice( key ) );
        return outcome::success();
    }

    outcome::result<void> rocksdb::Batch::commit()
    {
        if ( batch_.Count() == 0 )
        {
            return outcome::success();
        }
        auto status = db_.db_->Write( db_.wo_, &batch_ );
        if ( !status.ok() )
        {
            db_.logger_->error( "Failed to commit batch of {} operations", batch_.Count() );
            return error_as_result<void>( status, db_.logger_ );
        }
        batch_.Clear();
        return outcome::success();
    }

    void rocksdb::Batch::clear()
    {
        batch_.Clear();
    }

} // namespace blockwatch::storage
