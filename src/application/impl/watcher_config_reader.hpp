#ifndef BLOCKWATCH_APPLICATION_WATCHER_CONFIG_READER_HPP
#define BLOCKWATCH_APPLICATION_WATCHER_CONFIG_READER_HPP

#include <istream>

#include "application/watcher_config.hpp"
#include "outcome/outcome.hpp"

namespace blockwatch::application {

  /**
   * Parse a JSON watcher configuration. All entries live under the
   * "watcher" key.
   */
  outcome::result<WatcherConfig> parseWatcherConfig(std::istream &input);

  outcome::result<WatcherConfig> readWatcherConfig(const std::string &path);

  /**
   * Check a source URL and bring it to the form the watcher stores it in
   * @return URL ending with '/', INVALID_ENTRY for an unsupported scheme
   */
  outcome::result<primitives::SourceUrl> normalizeSourceUrl(
      const std::string &url);

}  // namespace blockwatch::application

#endif  // BLOCKWATCH_APPLICATION_WATCHER_CONFIG_READER_HPP
