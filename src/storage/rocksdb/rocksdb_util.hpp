#ifndef BLOCKWATCH_STORAGE_ROCKSDB_UTIL_HPP
#define BLOCKWATCH_STORAGE_ROCKSDB_UTIL_HPP

#include <rocksdb/status.h>

#include "outcome/outcome.hpp"
#include "base/logger.hpp"
#include "storage/database_error.hpp"

namespace blockwatch::storage
{

    /// DatabaseError matching a failed rocksdb status
    inline DatabaseError status_as_error( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        if ( s.IsNotFound() )
        {
            return DatabaseError::NOT_FOUND;
        }
        // transient conditions surface as IO errors, the caller stops syncing
        if ( s.IsIOError() || s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() )
        {
            return DatabaseError::IO_ERROR;
        }
        if ( s.IsInvalidArgument() )
        {
            return DatabaseError::INVALID_ARGUMENT;
        }
        if ( s.IsCorruption() )
        {
            return DatabaseError::CORRUPTION;
        }
        if ( s.IsNotSupported() )
        {
            return DatabaseError::NOT_SUPPORTED;
        }
        return DatabaseError::UNKNOWN;
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s )
    {
        return status_as_error( s );
    }

    template <typename T>
    outcome::result<T> error_as_result( const ::ROCKSDB_NAMESPACE::Status &s, const base::Logger &logger )
    {
        logger->error( "rocksdb: {}", s.ToString() );
        return status_as_error( s );
    }

    inline ::ROCKSDB_NAMESPACE::Slice make_slice( const std::string &buf )
    {
        return ::ROCKSDB_NAMESPACE::Slice{ buf.data(), buf.size() };
    }

} // namespace blockwatch::storage

#endif // BLOCKWATCH_STORAGE_ROCKSDB_UTIL_HPP
