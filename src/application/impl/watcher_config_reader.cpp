#include "application/impl/watcher_config_reader.hpp"

#include <fstream>

#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/pt_util.hpp"
#include "base/logger.hpp"
#include "network/block_path.hpp"

namespace blockwatch::application {

  namespace pt = boost::property_tree;

  outcome::result<primitives::SourceUrl> normalizeSourceUrl(
      const std::string &url) {
    auto parsed = network::parseUrl(url);
    if (! parsed) {
      return ConfigReaderError::INVALID_ENTRY;
    }
    const auto &scheme = parsed.value().scheme;
    if (scheme != "http" && scheme != "https" && scheme != "file") {
      return ConfigReaderError::INVALID_ENTRY;
    }
    if (url.back() == '/') {
      return url;
    }
    return url + "/";
  }

  namespace {

    outcome::result<std::chrono::milliseconds> readInterval(
        const pt::ptree &tree, const std::string &path,
        std::chrono::milliseconds default_value) {
      OUTCOME_TRY(ms, getOr<uint64_t>(tree, path, default_value.count()));
      if (ms == 0) {
        return ConfigReaderError::INVALID_ENTRY;
      }
      return std::chrono::milliseconds(ms);
    }

    outcome::result<WatcherConfig> readTree(const pt::ptree &root) {
      auto watcher_tree = root.get_child_optional("watcher");
      if (! watcher_tree) {
        return ConfigReaderError::MISSING_ENTRY;
      }
      const auto &tree = watcher_tree.value();
      WatcherConfig config;

      OUTCOME_TRY(sources, ensure(tree.get_child_optional("sources")));
      for (const auto &[key, source] : sources) {
        auto url = source.get_value_optional<std::string>();
        if (! url || url->empty()) {
          return ConfigReaderError::INVALID_ENTRY;
        }
        OUTCOME_TRY(normalized, normalizeSourceUrl(url.value()));
        config.sources.insert(std::move(normalized));
      }
      if (config.sources.empty()) {
        return ConfigReaderError::MISSING_ENTRY;
      }

      OUTCOME_TRY(ledger_path,
                  ensure(tree.get_optional<std::string>("ledger_path")));
      if (ledger_path.empty()) {
        return ConfigReaderError::INVALID_ENTRY;
      }
      config.ledger_path = std::move(ledger_path);

      OUTCOME_TRY(db_path, getOr<std::string>(tree, "db_path", ""));
      config.db_path = std::move(db_path);

      OUTCOME_TRY(poll_interval,
                  readInterval(tree, "poll_interval_ms", config.poll_interval));
      config.poll_interval = poll_interval;
      OUTCOME_TRY(
          request_timeout,
          readInterval(tree, "request_timeout_ms", config.request_timeout));
      config.request_timeout = request_timeout;
      OUTCOME_TRY(
          status_interval,
          readInterval(tree, "status_interval_ms", config.status_interval));
      config.status_interval = status_interval;

      OUTCOME_TRY(store_block_data,
                  getOr<bool>(tree, "store_block_data", false));
      config.store_block_data = store_block_data;

      OUTCOME_TRY(level_name, getOr<std::string>(tree, "log_level", "info"));
      auto level = base::parseLevel(level_name);
      if (! level) {
        return ConfigReaderError::INVALID_ENTRY;
      }
      config.log_level = level.value();

      return config;
    }

  }  // namespace

  outcome::result<WatcherConfig> parseWatcherConfig(std::istream &input) {
    pt::ptree root;
    try {
      pt::read_json(input, root);
    } catch (const pt::json_parser_error &e) {
      spdlog::error("Failed to parse watcher config: {}", e.what());
      return ConfigReaderError::PARSER_ERROR;
    }
    return readTree(root);
  }

  outcome::result<WatcherConfig> readWatcherConfig(const std::string &path) {
    std::ifstream input(path);
    if (! input) {
      spdlog::error("Cannot open watcher config {}", path);
      return ConfigReaderError::PARSER_ERROR;
    }
    return parseWatcherConfig(input);
  }

}  // namespace blockwatch::application
