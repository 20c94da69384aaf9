#include <iostream>

#include "application/impl/watcher_config_reader.hpp"
#include "base/blockwatch_version.hpp"
#include "base/logger.hpp"
#include "cli.hpp"
#include "watcher_node.hpp"

int main( int argc, char *const *argv )
{
    auto cmd = blockwatch::node::parseCommandLine( argc, argv );
    if ( !cmd )
    {
        std::cerr << cmd.error().message() << std::endl;
        std::cerr << blockwatch::node::cliOptions() << std::endl;
        return 1;
    }
    if ( cmd.value().show_help )
    {
        std::cout << blockwatch::node::cliOptions() << std::endl;
        return 0;
    }
    if ( cmd.value().show_version )
    {
        std::cout << blockwatch::version::BlockWatcherVersionText() << std::endl;
        return 0;
    }

    auto config = blockwatch::application::readWatcherConfig( cmd.value().config_path );
    if ( !config )
    {
        std::cerr << "Failed to read " << cmd.value().config_path << ": " << config.error().message() << std::endl;
        return 1;
    }
    if ( auto overridden = blockwatch::node::applyOverrides( cmd.value(), config.value() ); !overridden )
    {
        std::cerr << overridden.error().message() << std::endl;
        return 1;
    }
    blockwatch::base::setLogLevel( config.value().log_level );

    auto logger = blockwatch::base::createLogger( "main" );
    logger->info( "Starting {}", blockwatch::version::BlockWatcherVersionText() );

    blockwatch::node::WatcherNode node( std::move( config.value() ) );
    if ( auto started = node.start(); !started )
    {
        logger->critical( "Failed to start watcher: {}", started.error().message() );
        return 1;
    }
    return node.run();
}
