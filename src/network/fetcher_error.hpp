#ifndef BLOCKWATCH_NETWORK_FETCHER_ERROR_HPP
#define BLOCKWATCH_NETWORK_FETCHER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace blockwatch::network
{
    /**
     * Errors of a single block fetch attempt. None of them is fatal to the
     * watcher, the source is simply retried later
     */
    enum class FetcherError
    {
        INVALID_URL = 1,
        UNSUPPORTED_SCHEME,
        CONNECTION_FAILED,
        NOT_FOUND,
        HTTP_ERROR,
        READ_FAILED,
        MALFORMED_BLOCK,
        INDEX_MISMATCH,
        WORKER_SPAWN_FAILED,
    };
} // namespace blockwatch::network

OUTCOME_HPP_DECLARE_ERROR_2( blockwatch::network, FetcherError );

#endif // BLOCKWATCH_NETWORK_FETCHER_ERROR_HPP
