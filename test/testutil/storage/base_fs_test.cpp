#include "testutil/storage/base_fs_test.hpp"

#include <boost/filesystem/fstream.hpp>

namespace test
{
    FSFixture::FSFixture( fs::path path ) : base_path( fs::temp_directory_path() / std::move( path ) )
    {
        clear();
        fs::create_directories( base_path );
    }

    FSFixture::~FSFixture()
    {
        clear();
    }

    void FSFixture::SetUp()
    {
        clear();
        fs::create_directories( base_path );
    }

    void FSFixture::clear()
    {
        boost::system::error_code ec;
        fs::remove_all( base_path, ec );
    }

    void FSFixture::writeFile( const std::string &relative_path, const std::string &content ) const
    {
        auto path = base_path / relative_path;
        fs::create_directories( path.parent_path() );
        fs::ofstream out( path, std::ios::binary | std::ios::trunc );
        out << content;
    }
}
