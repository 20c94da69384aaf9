/**
 * @file blockwatch_version.cpp
 * @brief Version retrieval functions for BlockWatcher.
 *
 * BLOCKWATCH_VERSION_MAJOR, BLOCKWATCH_VERSION_MINOR and
 * BLOCKWATCH_VERSION_PATCH are defined via CMake from the project version.
 */
#include "base/blockwatch_version.hpp"

#include <spdlog/fmt/fmt.h>

uint64_t blockwatch::version::BlockWatcherVersionNum()
{
    return static_cast<uint64_t>( BLOCKWATCH_VERSION_MAJOR ) * 1000000 +
           static_cast<uint64_t>( BLOCKWATCH_VERSION_MINOR ) * 1000 + BLOCKWATCH_VERSION_PATCH;
}

uint32_t blockwatch::version::BlockWatcherVersionMajor()
{
    return BLOCKWATCH_VERSION_MAJOR;
}

uint32_t blockwatch::version::BlockWatcherVersionMinor()
{
    return BLOCKWATCH_VERSION_MINOR;
}

uint32_t blockwatch::version::BlockWatcherVersionPatch()
{
    return BLOCKWATCH_VERSION_PATCH;
}

std::string blockwatch::version::BlockWatcherVersionText()
{
    return fmt::format( "blockwatcher {}.{}.{}", BLOCKWATCH_VERSION_MAJOR, BLOCKWATCH_VERSION_MINOR,
                        BLOCKWATCH_VERSION_PATCH );
}
