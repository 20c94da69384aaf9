#include "watcher/watcher_sync_thread.hpp"

#include <algorithm>

namespace blockwatch::watcher
{
    WatcherSyncThread::WatcherSyncThread( std::shared_ptr<Watcher>        watcher,
                                          std::shared_ptr<ledger::Ledger> ledger,
                                          std::chrono::milliseconds       poll_interval ) :
        watcher_( std::move( watcher ) ),
        ledger_( std::move( ledger ) ),
        poll_interval_( poll_interval ),
        logger_( base::createLogger( "WatcherSyncThread" ) )
    {
        state_   = State::kRunning;
        thread_ = boost::thread( &WatcherSyncThread::run, this );
    }

    WatcherSyncThread::~WatcherSyncThread()
    {
        stop();
    }

    outcome::result<std::unique_ptr<WatcherSyncThread>> WatcherSyncThread::create(
        std::shared_ptr<WatcherDb>             db,
        std::shared_ptr<network::BlockFetcher> fetcher,
        std::shared_ptr<ledger::Ledger>        ledger,
        std::chrono::milliseconds              poll_interval,
        bool                                   store_block_data )
    {
        OUTCOME_TRY( watcher, Watcher::create( std::move( db ), std::move( fetcher ), store_block_data ) );
        return std::make_unique<WatcherSyncThread>( std::move( watcher ), std::move( ledger ), poll_interval );
    }

    void WatcherSyncThread::stop()
    {
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            stop_requested_ = true;
            auto running    = State::kRunning;
            state_.compare_exchange_strong( running, State::kStopRequested );
        }
        wakeup_.notify_all();
        std::call_once( joined_,
                        [this]
                        {
                            if ( thread_.joinable() )
                            {
                                thread_.join();
                            }
                        } );
    }

    bool WatcherSyncThread::isBehind() const
    {
        return is_behind_;
    }

    WatcherSyncThread::State WatcherSyncThread::state() const
    {
        return state_;
    }

    std::optional<std::error_code> WatcherSyncThread::lastError() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return last_error_;
    }

    void WatcherSyncThread::run()
    {
        logger_->debug( "Sync thread started, poll interval {} ms", poll_interval_.count() );
        auto result = runLoop();
        if ( !result )
        {
            logger_->critical( "Sync thread terminated: {}", result.error().message() );
            std::lock_guard<std::mutex> lock( mutex_ );
            last_error_ = result.error();
        }
        state_ = State::kStopped;
        logger_->debug( "Sync thread stopped" );
    }

    outcome::result<void> WatcherSyncThread::runLoop()
    {
        while ( !stop_requested_ )
        {
            OUTCOME_TRY( syncIteration() );
        }
        return outcome::success();
    }

    outcome::result<void> WatcherSyncThread::syncIteration()
    {
        OUTCOME_TRY( lowest, watcher_->lowestNextBlockToSync() );
        OUTCOME_TRY( ledger_blocks, ledger_->numBlocks() );

        bool behind = lowest < ledger_blocks;
        is_behind_  = behind;

        if ( behind )
        {
            auto max_height = std::min( ledger_blocks - 1, lowest + kMaxBlocksPerSyncIteration );
            logger_->debug( "Behind ledger ({} < {}), syncing up to block {}", lowest, ledger_blocks, max_height );
            OUTCOME_TRY( watcher_->syncBlocks( lowest, max_height ) );
        }
        else if ( !stop_requested_ )
        {
            logger_->trace( "Caught up with ledger at {} blocks", ledger_blocks );
            waitPollInterval();
        }
        return outcome::success();
    }

    void WatcherSyncThread::waitPollInterval()
    {
        std::unique_lock<std::mutex> lock( mutex_ );
        wakeup_.wait_for( lock, poll_interval_, [this] { return stop_requested_.load(); } );
    }
} // namespace blockwatch::watcher
