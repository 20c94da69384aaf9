#ifndef BLOCKWATCH_NODE_WATCHER_NODE_HPP
#define BLOCKWATCH_NODE_WATCHER_NODE_HPP

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "application/watcher_config.hpp"
#include "base/logger.hpp"
#include "storage/key_value_storage.hpp"
#include "watcher/watcher_sync_thread.hpp"

namespace blockwatch::node
{
    /**
     * Process wiring of a watcher: storage, fetcher, ledger and the sync
     * thread, stopped on SIGINT or SIGTERM
     */
    class WatcherNode
    {
    public:
        explicit WatcherNode( application::WatcherConfig config );

        ~WatcherNode();

        /**
         * Open the storage and start the sync thread
         */
        outcome::result<void> start();

        /**
         * Block until a termination signal arrives or the sync thread
         * terminates on its own, then stop the sync thread
         * @return process exit code
         */
        int run();

    private:
        outcome::result<std::shared_ptr<storage::KeyValueStorage>> openStorage() const;
        void                                                       scheduleStatus();
        void                                                       logStatus();
        void                                                       shutdown();

        application::WatcherConfig                   config_;
        boost::asio::io_context                      io_;
        boost::asio::signal_set                      signals_;
        boost::asio::steady_timer                    status_timer_;
        std::unique_ptr<watcher::WatcherSyncThread> sync_thread_;
        base::Logger                                 logger_;
    };
} // namespace blockwatch::node

#endif // BLOCKWATCH_NODE_WATCHER_NODE_HPP
