#include "watcher/parallel_fetch.hpp"

#include <optional>
#include <vector>

#include <boost/thread.hpp>

#include "base/logger.hpp"
#include "network/block_path.hpp"
#include "network/fetcher_error.hpp"

namespace blockwatch::watcher
{
    outcome::result<primitives::BlockMaterial> fetchSingleBlock( const network::BlockFetcher &fetcher,
                                                                 const primitives::SourceUrl &src_url,
                                                                 primitives::BlockIndex       block_index )
    {
        OUTCOME_TRY( block_url, network::resolveBlockUrl( src_url, network::blockIndexToPath( block_index ) ) );
        OUTCOME_TRY( material, fetcher.fetchBlock( block_url ) );
        if ( material.index != block_index )
        {
            return network::FetcherError::INDEX_MISMATCH;
        }
        return std::move( material );
    }

    BlockFetchResults parallelFetchBlocks( const std::map<primitives::SourceUrl, primitives::BlockIndex> &targets,
                                           const std::shared_ptr<network::BlockFetcher>                 &fetcher )
    {
        static auto logger = base::createLogger( "ParallelFetch" );

        using Slot = std::optional<outcome::result<primitives::BlockMaterial>>;

        // every worker writes only its own slot, read after all joins
        std::vector<std::pair<const primitives::SourceUrl *, primitives::BlockIndex>> jobs;
        jobs.reserve( targets.size() );
        for ( const auto &[src_url, block_index] : targets )
        {
            jobs.emplace_back( &src_url, block_index );
        }
        std::vector<Slot>          slots( jobs.size() );
        std::vector<boost::thread> workers;
        workers.reserve( jobs.size() );

        for ( size_t i = 0; i < jobs.size(); ++i )
        {
            try
            {
                workers.emplace_back(
                    [&fetcher, &job = jobs[i], &slot = slots[i]]
                    {
                        try
                        {
                            slot = fetchSingleBlock( *fetcher, *job.first, job.second );
                        }
                        catch ( const std::exception &e )
                        {
                            logger->error( "Fetching block {} from {} threw: {}", job.second, *job.first, e.what() );
                            slot = outcome::result<primitives::BlockMaterial>(
                                network::FetcherError::READ_FAILED );
                        }
                    } );
            }
            catch ( const boost::thread_resource_error &e )
            {
                logger->error( "Could not spawn fetch worker for {}: {}", *jobs[i].first, e.what() );
                slots[i] = outcome::result<primitives::BlockMaterial>( network::FetcherError::WORKER_SPAWN_FAILED );
            }
        }

        for ( auto &worker : workers )
        {
            worker.join();
        }

        BlockFetchResults results;
        for ( size_t i = 0; i < jobs.size(); ++i )
        {
            results.emplace( *jobs[i].first, BlockFetchResult{ jobs[i].second, std::move( *slots[i] ) } );
        }
        return results;
    }
} // namespace blockwatch::watcher
