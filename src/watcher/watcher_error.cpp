#include "watcher/watcher_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( blockwatch::watcher, WatcherError, e )
{
    using E = blockwatch::watcher::WatcherError;
    switch ( e )
    {
        case E::SOURCE_SET_MISMATCH:
            return "Block fetcher and watcher database watch different source URLs";
    }
    return "Unknown error";
}
