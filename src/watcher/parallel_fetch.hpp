#ifndef BLOCKWATCH_WATCHER_PARALLEL_FETCH_HPP
#define BLOCKWATCH_WATCHER_PARALLEL_FETCH_HPP

#include <map>
#include <memory>

#include "network/block_fetcher.hpp"

namespace blockwatch::watcher
{
    /**
     * Outcome of one fetch attempt for one source
     */
    struct BlockFetchResult
    {
        primitives::BlockIndex                      block_index;
        outcome::result<primitives::BlockMaterial> material;
    };

    using BlockFetchResults = std::map<primitives::SourceUrl, BlockFetchResult>;

    /**
     * Fetch one block from every source concurrently, one thread per source.
     * The number of sources is small, so a thread per source is cheaper than
     * keeping a pool alive between iterations.
     * Returns once every fetch has finished. A failing source never affects
     * the others, its error is reported in its own result.
     * @param targets source URL to the index of the block to fetch from it
     * @param fetcher fetcher shared by all threads
     */
    BlockFetchResults parallelFetchBlocks( const std::map<primitives::SourceUrl, primitives::BlockIndex> &targets,
                                           const std::shared_ptr<network::BlockFetcher>                 &fetcher );

    /**
     * Fetch a single block of a source: resolve the canonical path of the
     * index against the source URL and check that the archive returned the
     * block that was asked for.
     */
    outcome::result<primitives::BlockMaterial> fetchSingleBlock( const network::BlockFetcher &fetcher,
                                                                 const primitives::SourceUrl &src_url,
                                                                 primitives::BlockIndex       block_index );
} // namespace blockwatch::watcher

#endif // BLOCKWATCH_WATCHER_PARALLEL_FETCH_HPP
