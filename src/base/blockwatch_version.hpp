#pragma once

#include <cstdint>
#include <string>

namespace blockwatch
{
    namespace version
    {
        /**
         * @brief Retrieves the complete version number of BlockWatcher,
         * major * 1000000 + minor * 1000 + patch.
         *
         * @return uint64_t representing the version number.
         */
        uint64_t BlockWatcherVersionNum();

        /**
         * @brief Retrieves the major version of BlockWatcher.
         */
        uint32_t BlockWatcherVersionMajor();

        /**
         * @brief Retrieves the minor version of BlockWatcher.
         */
        uint32_t BlockWatcherVersionMinor();

        /**
         * @brief Retrieves the patch version of BlockWatcher.
         */
        uint32_t BlockWatcherVersionPatch();

        /**
         * @brief Retrieves the display version text, e.g. "blockwatcher 1.0.0".
         *
         * @return std::string representing the version text.
         */
        std::string BlockWatcherVersionText();
    }
}
