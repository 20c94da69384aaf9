#include "base/logger.hpp"

#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }

        if ( spdlog::get_level() <= spdlog::level::debug )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        logger->set_level( spdlog::get_level() );
        return logger;
    }

    std::mutex &loggerMutex()
    {
        static std::mutex mutex;
        return mutex;
    }
} // namespace

namespace blockwatch::base
{
    Logger createLogger( const std::string &tag )
    {
        return createFileLogger( tag, "" );
    }

    Logger createFileLogger( const std::string &tag, const std::string &path )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, path );
        }
        return logger;
    }

    std::optional<spdlog::level::level_enum> parseLevel( const std::string &name )
    {
        auto level = spdlog::level::from_str( name );
        // from_str falls back to "off" for names it does not know
        if ( level == spdlog::level::off && name != "off" )
        {
            return std::nullopt;
        }
        return level;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        spdlog::set_level( level );
        spdlog::apply_all(
            [level]( const std::shared_ptr<spdlog::logger> &logger )
            {
                if ( level <= spdlog::level::debug )
                {
                    setDebugPattern( *logger );
                }
                else
                {
                    setGlobalPattern( *logger );
                }
            } );
    }
} // namespace blockwatch::base
