#ifndef BLOCKWATCH_WATCHER_DB_ERROR_HPP
#define BLOCKWATCH_WATCHER_DB_ERROR_HPP

#include "outcome/outcome.hpp"

namespace blockwatch::watcher
{
    /**
     * Errors of the watcher database. ALREADY_EXISTS is an expected answer
     * to a repeated write, every other one means the store is unusable.
     */
    enum class WatcherDbError
    {
        ALREADY_EXISTS = 1,
        NOT_FOUND,
        UNKNOWN_SOURCE_URL,
        CORRUPTED_RECORD,
    };
} // namespace blockwatch::watcher

OUTCOME_HPP_DECLARE_ERROR_2( blockwatch::watcher, WatcherDbError );

#endif // BLOCKWATCH_WATCHER_DB_ERROR_HPP
