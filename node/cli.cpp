#include "cli.hpp"

#include <iostream>

#include "base/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( blockwatch::node, CliError, e )
{
    using E = blockwatch::node::CliError;
    switch ( e )
    {
        case E::PARSE_ERROR:
            return "Could not parse command line";
        case E::MISSING_CONFIG:
            return "No configuration file given, use --config";
        case E::INVALID_ARGUMENTS:
            return "Invalid arguments";
    }
    return "Invalid error code";
}

namespace blockwatch::node
{
    namespace po = boost::program_options;

    po::options_description cliOptions()
    {
        po::options_description description( "Command line options" );
        // clang-format off
        description.add_options()
            ("help", "Print out options")
            ("version", "Prints out version")
            ("config", po::value<std::string>(), "Path of the JSON watcher configuration")
            ("log-level", po::value<std::string>(), "Log level: trace, debug, info, warning, error, critical or off")
            ("poll-interval-ms", po::value<uint64_t>(), "Milliseconds to wait between ledger polls while caught up")
            ("store-block-data", "Persist fetched block contents in addition to signatures");
        // clang-format on
        return description;
    }

    outcome::result<CommandLine> parseCommandLine( int argc, const char *const *argv )
    {
        po::variables_map vm;
        try
        {
            po::store( po::parse_command_line( argc, argv, cliOptions() ), vm );
            po::notify( vm );
        }
        catch ( const po::error &err )
        {
            std::cerr << err.what() << std::endl;
            return CliError::PARSE_ERROR;
        }

        CommandLine cmd;
        cmd.show_help        = vm.count( "help" ) > 0;
        cmd.show_version     = vm.count( "version" ) > 0;
        cmd.store_block_data = vm.count( "store-block-data" ) > 0;
        if ( cmd.show_help || cmd.show_version )
        {
            return cmd;
        }

        auto config_it = vm.find( "config" );
        if ( config_it == vm.end() )
        {
            return CliError::MISSING_CONFIG;
        }
        cmd.config_path = config_it->second.as<std::string>();

        auto log_level_it = vm.find( "log-level" );
        if ( log_level_it != vm.end() )
        {
            cmd.log_level = log_level_it->second.as<std::string>();
        }
        auto poll_interval_it = vm.find( "poll-interval-ms" );
        if ( poll_interval_it != vm.end() )
        {
            cmd.poll_interval_ms = poll_interval_it->second.as<uint64_t>();
        }
        return cmd;
    }

    outcome::result<void> applyOverrides( const CommandLine &cmd, application::WatcherConfig &config )
    {
        if ( cmd.log_level )
        {
            auto level = base::parseLevel( *cmd.log_level );
            if ( !level )
            {
                return CliError::INVALID_ARGUMENTS;
            }
            config.log_level = *level;
        }
        if ( cmd.poll_interval_ms )
        {
            if ( *cmd.poll_interval_ms == 0 )
            {
                return CliError::INVALID_ARGUMENTS;
            }
            config.poll_interval = std::chrono::milliseconds( *cmd.poll_interval_ms );
        }
        if ( cmd.store_block_data )
        {
            config.store_block_data = true;
        }
        return outcome::success();
    }
} // namespace blockwatch::node
