#ifndef BLOCKWATCH_LOGGER_HPP
#define BLOCKWATCH_LOGGER_HPP

#include <optional>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace blockwatch::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * Provide logger object
     * @param tag - tagging name for identifying logger
     * @return logger object
     */
    Logger createLogger( const std::string &tag );

    /**
     * Provide logger object writing into a file instead of the console
     * @param tag - tagging name for identifying logger
     * @param path - file the logger appends to
     * @return logger object
     */
    Logger createFileLogger( const std::string &tag, const std::string &path );

    /**
     * Parse a level name ("trace", "debug", "info", "warning", "error",
     * "critical", "off")
     * @return parsed level, std::nullopt if the name is unknown
     */
    std::optional<spdlog::level::level_enum> parseLevel( const std::string &name );

    /**
     * Apply the level to every registered logger and to the ones created later
     */
    void setLogLevel( spdlog::level::level_enum level );
} // namespace blockwatch::base

#endif // BLOCKWATCH_LOGGER_HPP
