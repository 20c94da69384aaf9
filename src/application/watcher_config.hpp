#ifndef BLOCKWATCH_APPLICATION_WATCHER_CONFIG_HPP
#define BLOCKWATCH_APPLICATION_WATCHER_CONFIG_HPP

#include <chrono>
#include <set>
#include <string>

#include <spdlog/common.h>

#include "primitives/common.hpp"

namespace blockwatch::application {

  /**
   * Settings of a watcher node
   */
  struct WatcherConfig {
    /// archive base URLs, each ending with '/'
    std::set<primitives::SourceUrl> sources;
    /// local archive the ledger height is read from
    std::string ledger_path;
    /// RocksDB directory, in-memory storage when empty
    std::string db_path;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds status_interval{10000};
    bool store_block_data = false;
    spdlog::level::level_enum log_level = spdlog::level::info;
  };

}  // namespace blockwatch::application

#endif  // BLOCKWATCH_APPLICATION_WATCHER_CONFIG_HPP
