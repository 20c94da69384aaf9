#include "watcher/watcher_db_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( blockwatch::watcher, WatcherDbError, e )
{
    using E = blockwatch::watcher::WatcherDbError;
    switch ( e )
    {
        case E::ALREADY_EXISTS:
            return "Record already exists";
        case E::NOT_FOUND:
            return "Record was not found";
        case E::UNKNOWN_SOURCE_URL:
            return "Source URL is not configured in the watcher database";
        case E::CORRUPTED_RECORD:
            return "Watcher database record could not be decoded";
    }
    return "Unknown error";
}
