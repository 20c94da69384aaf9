#ifndef BLOCKWATCH_BASE_FS_TEST_HPP
#define BLOCKWATCH_BASE_FS_TEST_HPP

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

// intentionally here, so users can use fs shortcut
namespace fs = boost::filesystem;

namespace test
{
    /**
     * @brief Base test, which involves filesystem. The directory at path is
     * emptied before each test and removed when the fixture is destroyed.
     */
    struct FSFixture : public ::testing::Test
    {
        // not explicit, intentionally
        FSFixture( fs::path path );

        ~FSFixture() override;

        void SetUp() override;

        [[nodiscard]] std::string getPathString() const
        {
            return fs::canonical( base_path ).string();
        }

        /**
         * Write a file below the fixture directory, creating missing
         * directories
         */
        void writeFile( const std::string &relative_path, const std::string &content ) const;

    protected:
        void clear();

        fs::path base_path;
    };
}

#endif
