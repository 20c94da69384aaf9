#include "cli.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace blockwatch::node;
using namespace std::chrono_literals;

namespace {
  template <size_t N>
  outcome::result<CommandLine> parseArgs(const char *const (&args)[N]) {
    return parseCommandLine(static_cast<int>(N), args);
  }
}  // namespace

/**
 * @given a command line with all options
 * @when parsing it
 * @then every option is read
 */
TEST(CliTest, ParsesAllOptions) {
  const char *const args[] = {"blockwatcher",
                              "--config",
                              "/etc/blockwatcher.json",
                              "--log-level",
                              "trace",
                              "--poll-interval-ms",
                              "200",
                              "--store-block-data"};
  EXPECT_OUTCOME_TRUE(cmd, parseArgs(args));
  EXPECT_FALSE(cmd.show_help);
  EXPECT_EQ(cmd.config_path, "/etc/blockwatcher.json");
  EXPECT_EQ(cmd.log_level, std::string("trace"));
  EXPECT_EQ(cmd.poll_interval_ms, uint64_t{200});
  EXPECT_TRUE(cmd.store_block_data);
}

/**
 * @given --help or --version without configuration
 * @when parsing the command line
 * @then parsing succeeds with the flag set
 */
TEST(CliTest, HelpAndVersionNeedNoConfig) {
  const char *const help[] = {"blockwatcher", "--help"};
  EXPECT_OUTCOME_TRUE(help_cmd, parseArgs(help));
  EXPECT_TRUE(help_cmd.show_help);

  const char *const version[] = {"blockwatcher", "--version"};
  EXPECT_OUTCOME_TRUE(version_cmd, parseArgs(version));
  EXPECT_TRUE(version_cmd.show_version);
}

/**
 * @given command lines without config or with unknown options
 * @when parsing them
 * @then MISSING_CONFIG and PARSE_ERROR are returned
 */
TEST(CliTest, RejectsIncompleteCommandLines) {
  const char *const no_config[] = {"blockwatcher", "--log-level", "info"};
  EXPECT_EC(parseArgs(no_config), CliError::MISSING_CONFIG);

  const char *const unknown[] = {"blockwatcher", "--config", "c.json", "--frobnicate"};
  EXPECT_EC(parseArgs(unknown), CliError::PARSE_ERROR);

  const char *const not_a_number[] = {"blockwatcher", "--config", "c.json", "--poll-interval-ms", "soon"};
  EXPECT_EC(parseArgs(not_a_number), CliError::PARSE_ERROR);
}

/**
 * @given a configuration read from file
 * @when applying command line overrides
 * @then only the given options change it
 */
TEST(CliTest, OverridesConfiguration) {
  blockwatch::application::WatcherConfig config;
  config.poll_interval = 1000ms;

  CommandLine cmd;
  cmd.log_level = "error";
  EXPECT_OUTCOME_TRUE_1(applyOverrides(cmd, config));
  EXPECT_EQ(config.log_level, spdlog::level::err);
  EXPECT_EQ(config.poll_interval, 1000ms);
  EXPECT_FALSE(config.store_block_data);

  cmd.poll_interval_ms = 50;
  cmd.store_block_data = true;
  EXPECT_OUTCOME_TRUE_1(applyOverrides(cmd, config));
  EXPECT_EQ(config.poll_interval, 50ms);
  EXPECT_TRUE(config.store_block_data);
}

/**
 * @given invalid override values
 * @when applying them
 * @then INVALID_ARGUMENTS is returned
 */
TEST(CliTest, RejectsInvalidOverrides) {
  blockwatch::application::WatcherConfig config;
  CommandLine bad_level;
  bad_level.log_level = "loud";
  EXPECT_EC(applyOverrides(bad_level, config), CliError::INVALID_ARGUMENTS);

  CommandLine zero_interval;
  zero_interval.poll_interval_ms = 0;
  EXPECT_EC(applyOverrides(zero_interval, config), CliError::INVALID_ARGUMENTS);
}
