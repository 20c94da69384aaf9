#ifndef BLOCKWATCH_NETWORK_BLOCK_PATH_HPP
#define BLOCKWATCH_NETWORK_BLOCK_PATH_HPP

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace blockwatch::network
{
    /**
     * @brief Canonical path of a block inside an archive, relative to the
     * archive root. The 16 digit hex index is split into seven directory
     * levels so that no directory holds more than 256 entries, e.g.
     * 00/00/00/00/00/00/00/0000000000000001.json
     * @param index block index
     * @return relative path using '/' separators
     */
    std::string blockIndexToPath( primitives::BlockIndex index );

    /**
     * @brief Resolve a relative path against an archive base URL. The last
     * path segment of the base is replaced unless the base ends with '/'
     * @return absolute URL or FetcherError::INVALID_URL if the base has no
     * scheme and authority
     */
    outcome::result<std::string> resolveBlockUrl( std::string_view base, std::string_view relative_path );

    /**
     * @brief Components of an absolute URL as needed to issue a request
     */
    struct Url
    {
        std::string scheme; ///< lowercase, without "://"
        std::string host;   ///< empty for file URLs
        std::string port;   ///< scheme default when not given
        std::string target; ///< path with query, starts with '/'
    };

    /**
     * @brief Split an absolute http, https or file URL
     * @return parsed URL, FetcherError::INVALID_URL if it cannot be parsed
     */
    outcome::result<Url> parseUrl( std::string_view url );
} // namespace blockwatch::network

#endif // BLOCKWATCH_NETWORK_BLOCK_PATH_HPP
