#include "network/block_path.hpp"

#include <regex>

#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/fmt/fmt.h>

#include "network/fetcher_error.hpp"

namespace blockwatch::network
{
    namespace
    {
        constexpr size_t kDirectoryLevels = 7;
        constexpr auto   kBlockFileExtension = ".json";

        /// Position where the path of an absolute URL starts, npos if there
        /// is no "scheme://" prefix
        size_t pathStart( std::string_view url )
        {
            auto scheme_end = url.find( "://" );
            if ( scheme_end == std::string_view::npos || scheme_end == 0 )
            {
                return std::string_view::npos;
            }
            auto path_start = url.find( '/', scheme_end + 3 );
            return path_start == std::string_view::npos ? url.size() : path_start;
        }
    } // namespace

    std::string blockIndexToPath( primitives::BlockIndex index )
    {
        const auto  filename = fmt::format( "{:016x}", index );
        std::string path;
        path.reserve( kDirectoryLevels * 3 + filename.size() + 5 );
        for ( size_t level = 0; level < kDirectoryLevels; ++level )
        {
            path.append( filename, level * 2, 2 );
            path.push_back( '/' );
        }
        path.append( filename );
        path.append( kBlockFileExtension );
        return path;
    }

    outcome::result<std::string> resolveBlockUrl( std::string_view base, std::string_view relative_path )
    {
        auto path_start = pathStart( base );
        if ( path_start == std::string_view::npos )
        {
            return FetcherError::INVALID_URL;
        }

        // drop query and fragment of the base, they never take part in resolution
        auto base_end = base.find_first_of( "?#", path_start );
        if ( base_end != std::string_view::npos )
        {
            base = base.substr( 0, base_end );
        }

        std::string resolved;
        if ( path_start == base.size() )
        {
            // "http://host" has an empty path which resolves like "/"
            resolved.append( base );
            resolved.push_back( '/' );
        }
        else
        {
            auto last_slash = base.rfind( '/' );
            resolved.append( base.substr( 0, last_slash + 1 ) );
        }
        resolved.append( relative_path );
        return resolved;
    }

    outcome::result<Url> parseUrl( std::string_view url )
    {
        static const std::regex url_regex( R"(^([A-Za-z][A-Za-z0-9+.-]*)://([^/:?#]*)(?::(\d+))?(/[^#]*)?(?:#.*)?$)" );

        std::string  url_str( url );
        std::smatch  matches;
        if ( !std::regex_match( url_str, matches, url_regex ) )
        {
            return FetcherError::INVALID_URL;
        }

        Url parsed;
        parsed.scheme = boost::algorithm::to_lower_copy( matches[1].str() );
        parsed.host   = matches[2].str();
        parsed.target = matches[4].matched ? matches[4].str() : "/";

        if ( matches[3].matched )
        {
            parsed.port = matches[3].str();
        }
        else if ( parsed.scheme == "https" )
        {
            parsed.port = "443";
        }
        else if ( parsed.scheme == "http" )
        {
            parsed.port = "80";
        }

        if ( parsed.scheme != "file" && parsed.host.empty() )
        {
            return FetcherError::INVALID_URL;
        }
        return parsed;
    }
} // namespace blockwatch::network
