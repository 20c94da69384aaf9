#ifndef BLOCKWATCH_WATCHER_ERROR_HPP
#define BLOCKWATCH_WATCHER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace blockwatch::watcher
{
    enum class WatcherError
    {
        /// fetcher and watcher database were configured with different sources
        SOURCE_SET_MISMATCH = 1,
    };
} // namespace blockwatch::watcher

OUTCOME_HPP_DECLARE_ERROR_2( blockwatch::watcher, WatcherError );

#endif // BLOCKWATCH_WATCHER_ERROR_HPP
