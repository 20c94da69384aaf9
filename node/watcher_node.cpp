#include "watcher_node.hpp"

#include <csignal>

#include "ledger/impl/archive_directory_ledger.hpp"
#include "network/impl/archive_block_fetcher.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "watcher/impl/key_value_watcher_db.hpp"

namespace blockwatch::node
{
    WatcherNode::WatcherNode( application::WatcherConfig config ) :
        config_( std::move( config ) ),
        signals_( io_, SIGINT, SIGTERM ),
        status_timer_( io_ ),
        logger_( base::createLogger( "WatcherNode" ) )
    {
    }

    WatcherNode::~WatcherNode()
    {
        shutdown();
    }

    outcome::result<std::shared_ptr<storage::KeyValueStorage>> WatcherNode::openStorage() const
    {
        if ( config_.db_path.empty() )
        {
            logger_->warn( "No db_path configured, synced state is kept in memory only" );
            return std::make_shared<storage::InMemoryStorage>();
        }
        OUTCOME_TRY( db, storage::rocksdb::create( config_.db_path ) );
        return db;
    }

    outcome::result<void> WatcherNode::start()
    {
        OUTCOME_TRY( storage, openStorage() );
        OUTCOME_TRY( db, watcher::KeyValueWatcherDb::create( storage, config_.sources ) );
        auto fetcher = std::make_shared<network::ArchiveBlockFetcher>( config_.sources, config_.request_timeout );
        auto ledger  = std::make_shared<ledger::ArchiveDirectoryLedger>( config_.ledger_path );

        OUTCOME_TRY( sync_thread, watcher::WatcherSyncThread::create( db, fetcher, ledger, config_.poll_interval,
                                                                      config_.store_block_data ) );
        sync_thread_ = std::move( sync_thread );
        logger_->info( "Watching {} sources, ledger at {}", config_.sources.size(), config_.ledger_path );
        return outcome::success();
    }

    int WatcherNode::run()
    {
        signals_.async_wait(
            [this]( const boost::system::error_code &ec, int signal_number )
            {
                if ( ec )
                {
                    return;
                }
                logger_->info( "Received signal {}, stopping", signal_number );
                io_.stop();
            } );
        scheduleStatus();
        io_.run();

        shutdown();
        if ( auto error = sync_thread_ ? sync_thread_->lastError() : std::nullopt )
        {
            logger_->error( "Sync thread failed: {}", error->message() );
            return 1;
        }
        return 0;
    }

    void WatcherNode::scheduleStatus()
    {
        status_timer_.expires_after( config_.status_interval );
        status_timer_.async_wait(
            [this]( const boost::system::error_code &ec )
            {
                if ( ec )
                {
                    return;
                }
                logStatus();
                if ( sync_thread_ && sync_thread_->state() == watcher::WatcherSyncThread::State::kStopped )
                {
                    io_.stop();
                    return;
                }
                scheduleStatus();
            } );
    }

    void WatcherNode::logStatus()
    {
        if ( !sync_thread_ )
        {
            return;
        }
        auto lowest = sync_thread_->watcher()->lowestNextBlockToSync();
        if ( !lowest )
        {
            logger_->warn( "Cannot read sync progress: {}", lowest.error().message() );
            return;
        }
        logger_->info( "Watcher {}, lowest next block to sync {}",
                       sync_thread_->isBehind() ? "behind ledger" : "caught up", lowest.value() );
    }

    void WatcherNode::shutdown()
    {
        status_timer_.cancel();
        signals_.cancel();
        if ( sync_thread_ )
        {
            sync_thread_->stop();
        }
    }
} // namespace blockwatch::node
