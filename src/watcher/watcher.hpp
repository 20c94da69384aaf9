#ifndef BLOCKWATCH_WATCHER_HPP
#define BLOCKWATCH_WATCHER_HPP

#include <memory>
#include <optional>

#include "base/logger.hpp"
#include "network/block_fetcher.hpp"
#include "watcher/parallel_fetch.hpp"
#include "watcher/watcher_db.hpp"

namespace blockwatch::watcher
{
    /**
     * Synchronizes the watcher database with the archives of all sources.
     * Every source advances independently, a source failing to deliver a
     * block never holds back the others.
     */
    class Watcher
    {
    public:
        /**
         * @param db store of cursors and signatures
         * @param fetcher fetcher configured with the same sources as the db
         * @param store_block_data persist the fetched block material as well
         * @return WatcherError::SOURCE_SET_MISMATCH if db and fetcher watch
         * different sources
         */
        static outcome::result<std::shared_ptr<Watcher>> create( std::shared_ptr<WatcherDb>             db,
                                                                 std::shared_ptr<network::BlockFetcher> fetcher,
                                                                 bool                                   store_block_data );

        /**
         * @return lowest index still missing from some source, 0 if there are
         * no sources
         */
        outcome::result<primitives::BlockIndex> lowestNextBlockToSync() const;

        /**
         * Fetch blocks from all sources until every source reached max_height
         * or no source made progress in an iteration.
         * @param start first block to fetch from sources that never synced
         * @param max_height last block to sync, unbounded if not set
         * @return true if every source reached max_height, false if an
         * iteration made no progress
         */
        outcome::result<bool> syncBlocks( primitives::BlockIndex start, std::optional<primitives::BlockIndex> max_height );

    private:
        Watcher( std::shared_ptr<WatcherDb> db, std::shared_ptr<network::BlockFetcher> fetcher, bool store_block_data );

        outcome::result<std::map<primitives::SourceUrl, primitives::BlockIndex>> nextTargets(
            primitives::BlockIndex start, std::optional<primitives::BlockIndex> max_height ) const;

        outcome::result<void> storeFetchedBlock( const primitives::SourceUrl     &src_url,
                                                 const primitives::BlockMaterial &material );

        std::shared_ptr<WatcherDb>             db_;
        std::shared_ptr<network::BlockFetcher> fetcher_;
        bool                                   store_block_data_;
        base::Logger                           logger_;
    };
} // namespace blockwatch::watcher

#endif // BLOCKWATCH_WATCHER_HPP
