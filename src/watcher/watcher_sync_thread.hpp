#ifndef BLOCKWATCH_WATCHER_SYNC_THREAD_HPP
#define BLOCKWATCH_WATCHER_SYNC_THREAD_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include <boost/thread.hpp>

#include "ledger/ledger.hpp"
#include "watcher/watcher.hpp"

namespace blockwatch::watcher
{
    /**
     * Background driver keeping the watcher database in step with the local
     * ledger. While the watcher is behind the ledger it syncs at most
     * kMaxBlocksPerSyncIteration blocks per iteration, otherwise it waits for
     * the poll interval. The thread is stopped and joined on destruction.
     */
    class WatcherSyncThread
    {
    public:
        enum class State
        {
            kIdle,
            kRunning,
            kStopRequested,
            kStopped,
        };

        static constexpr primitives::BlockIndex    kMaxBlocksPerSyncIteration = 10;
        static constexpr std::chrono::milliseconds kDefaultPollInterval{ 1000 };

        /**
         * Start syncing in a new thread
         */
        WatcherSyncThread( std::shared_ptr<Watcher>        watcher,
                           std::shared_ptr<ledger::Ledger> ledger,
                           std::chrono::milliseconds       poll_interval = kDefaultPollInterval );

        ~WatcherSyncThread();

        WatcherSyncThread( const WatcherSyncThread & )            = delete;
        WatcherSyncThread &operator=( const WatcherSyncThread & ) = delete;

        /**
         * Build a watcher over db and fetcher and start syncing it against
         * the ledger
         * @return error of Watcher::create
         */
        static outcome::result<std::unique_ptr<WatcherSyncThread>> create(
            std::shared_ptr<WatcherDb>             db,
            std::shared_ptr<network::BlockFetcher> fetcher,
            std::shared_ptr<ledger::Ledger>        ledger,
            std::chrono::milliseconds              poll_interval,
            bool                                   store_block_data );

        /**
         * Request the loop to exit and wait for the thread. The iteration in
         * progress is completed first. Calling it again has no effect.
         */
        void stop();

        /**
         * @return true if the last iteration found the watcher behind the
         * ledger
         */
        bool isBehind() const;

        State state() const;

        /**
         * @return error which terminated the loop, if any
         */
        std::optional<std::error_code> lastError() const;

        const std::shared_ptr<Watcher> &watcher() const
        {
            return watcher_;
        }

    private:
        void                  run();
        outcome::result<void> runLoop();
        outcome::result<void> syncIteration();
        void                  waitPollInterval();

        std::shared_ptr<Watcher>        watcher_;
        std::shared_ptr<ledger::Ledger> ledger_;
        std::chrono::milliseconds       poll_interval_;

        std::atomic<bool>  is_behind_{ false };
        std::atomic<bool>  stop_requested_{ false };
        std::atomic<State> state_{ State::kIdle };

        mutable std::mutex              mutex_;
        std::condition_variable         wakeup_;
        std::optional<std::error_code>  last_error_;
        std::once_flag                  joined_;

        base::Logger  logger_;
        boost::thread thread_;
    };
} // namespace blockwatch::watcher

#endif // BLOCKWATCH_WATCHER_SYNC_THREAD_HPP
