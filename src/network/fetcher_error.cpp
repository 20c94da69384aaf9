#include "network/fetcher_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( blockwatch::network, FetcherError, e )
{
    using E = blockwatch::network::FetcherError;
    switch ( e )
    {
        case E::INVALID_URL:
            return "Malformed block URL";
        case E::UNSUPPORTED_SCHEME:
            return "URL scheme is not supported by the fetcher";
        case E::CONNECTION_FAILED:
            return "Could not connect to the archive";
        case E::NOT_FOUND:
            return "Block is not published by the archive";
        case E::HTTP_ERROR:
            return "Archive answered with an unexpected HTTP status";
        case E::READ_FAILED:
            return "Could not read the block from the archive";
        case E::MALFORMED_BLOCK:
            return "Archive block could not be decoded";
        case E::INDEX_MISMATCH:
            return "Archive block has an unexpected index";
        case E::WORKER_SPAWN_FAILED:
            return "Could not start a fetch worker";
    }
    return "Unknown error";
}
