#ifndef BLOCKWATCH_NODE_CLI_HPP
#define BLOCKWATCH_NODE_CLI_HPP

#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include "application/watcher_config.hpp"
#include "outcome/outcome.hpp"

namespace blockwatch::node
{
    /** Command line related error codes */
    enum class CliError
    {
        PARSE_ERROR = 1,
        MISSING_CONFIG,
        INVALID_ARGUMENTS,
    };

    /**
     * Options given on the command line. Optional values override the ones
     * from the configuration file.
     */
    struct CommandLine
    {
        bool                       show_help    = false;
        bool                       show_version = false;
        std::string                config_path;
        std::optional<std::string> log_level;
        std::optional<uint64_t>    poll_interval_ms;
        bool                       store_block_data = false;
    };

    boost::program_options::options_description cliOptions();

    /**
     * @return parsed options, CliError::MISSING_CONFIG if neither --help,
     * --version nor --config is given
     */
    outcome::result<CommandLine> parseCommandLine( int argc, const char *const *argv );

    /**
     * Apply command line overrides to a configuration read from file
     */
    outcome::result<void> applyOverrides( const CommandLine &cmd, application::WatcherConfig &config );
} // namespace blockwatch::node

OUTCOME_HPP_DECLARE_ERROR_2( blockwatch::node, CliError );

#endif // BLOCKWATCH_NODE_CLI_HPP
