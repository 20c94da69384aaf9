#ifndef BLOCKWATCH_NETWORK_BLOCK_FETCHER_HPP
#define BLOCKWATCH_NETWORK_BLOCK_FETCHER_HPP

#include <set>

#include "outcome/outcome.hpp"
#include "primitives/block_material.hpp"

namespace blockwatch::network
{
    /**
     * Retrieves archived blocks of the watched sources. Implementations must
     * be safe to call from several threads at once
     */
    class BlockFetcher
    {
    public:
        virtual ~BlockFetcher() = default;

        /**
         * @return base URLs of the archives this fetcher was configured with
         */
        virtual const std::set<primitives::SourceUrl> &sourceUrls() const = 0;

        /**
         * Fetch and decode the block published at the URL
         * @param url absolute URL of the block file
         * @return block material or a FetcherError
         */
        virtual outcome::result<primitives::BlockMaterial> fetchBlock( const std::string &url ) const = 0;
    };
} // namespace blockwatch::network

#endif // BLOCKWATCH_NETWORK_BLOCK_FETCHER_HPP
