#include "watcher/watcher.hpp"

#include <algorithm>
#include <limits>

#include "network/block_path.hpp"
#include "watcher/watcher_db_error.hpp"
#include "watcher/watcher_error.hpp"

namespace blockwatch::watcher
{
    using primitives::BlockIndex;
    using primitives::SourceUrl;

    Watcher::Watcher( std::shared_ptr<WatcherDb>             db,
                      std::shared_ptr<network::BlockFetcher> fetcher,
                      bool                                   store_block_data ) :
        db_( std::move( db ) ),
        fetcher_( std::move( fetcher ) ),
        store_block_data_( store_block_data ),
        logger_( base::createLogger( "Watcher" ) )
    {
    }

    outcome::result<std::shared_ptr<Watcher>> Watcher::create( std::shared_ptr<WatcherDb>             db,
                                                               std::shared_ptr<network::BlockFetcher> fetcher,
                                                               bool                                   store_block_data )
    {
        OUTCOME_TRY( db_urls, db->getConfigUrls() );
        if ( db_urls != fetcher->sourceUrls() )
        {
            return WatcherError::SOURCE_SET_MISMATCH;
        }
        return std::shared_ptr<Watcher>( new Watcher( std::move( db ), std::move( fetcher ), store_block_data ) );
    }

    outcome::result<BlockIndex> Watcher::lowestNextBlockToSync() const
    {
        OUTCOME_TRY( last_synced, db_->lastSyncedBlocks() );
        if ( last_synced.empty() )
        {
            return BlockIndex{ 0 };
        }
        auto lowest = std::numeric_limits<BlockIndex>::max();
        for ( const auto &[src_url, index] : last_synced )
        {
            lowest = std::min( lowest, index ? *index + 1 : BlockIndex{ 0 } );
        }
        return lowest;
    }

    outcome::result<std::map<SourceUrl, BlockIndex>> Watcher::nextTargets(
        BlockIndex start, std::optional<BlockIndex> max_height ) const
    {
        OUTCOME_TRY( last_synced, db_->lastSyncedBlocks() );
        std::map<SourceUrl, BlockIndex> targets;
        for ( const auto &[src_url, index] : last_synced )
        {
            if ( max_height && index && *index >= *max_height )
            {
                continue;
            }
            targets.emplace( src_url, index ? *index + 1 : start );
        }
        return targets;
    }

    outcome::result<void> Watcher::storeFetchedBlock( const SourceUrl &src_url, const primitives::BlockMaterial &material )
    {
        if ( store_block_data_ )
        {
            auto stored = db_->addBlockData( src_url, material );
            if ( !stored && stored.error() != WatcherDbError::ALREADY_EXISTS )
            {
                return stored.error();
            }
        }
        if ( material.signature )
        {
            return db_->addBlockSignature( src_url, material.index, *material.signature,
                                           network::blockIndexToPath( material.index ) );
        }
        return db_->updateLastSynced( src_url, material.index );
    }

    outcome::result<bool> Watcher::syncBlocks( BlockIndex start, std::optional<BlockIndex> max_height )
    {
        while ( true )
        {
            OUTCOME_TRY( targets, nextTargets( start, max_height ) );
            if ( targets.empty() )
            {
                return true;
            }

            auto results     = parallelFetchBlocks( targets, fetcher_ );
            bool had_success = false;
            for ( auto &[src_url, fetched] : results )
            {
                if ( !fetched.material )
                {
                    logger_->debug( "Failed to retrieve block {} from {}: {}", fetched.block_index, src_url,
                                    fetched.material.error().message() );
                    continue;
                }
                logger_->info( "Retrieved block {} from {}", fetched.block_index, src_url );
                OUTCOME_TRY( storeFetchedBlock( src_url, fetched.material.value() ) );
                had_success = true;
            }

            if ( !had_success )
            {
                return false;
            }
        }
    }
} // namespace blockwatch::watcher
