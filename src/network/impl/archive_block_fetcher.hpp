#ifndef BLOCKWATCH_NETWORK_ARCHIVE_BLOCK_FETCHER_HPP
#define BLOCKWATCH_NETWORK_ARCHIVE_BLOCK_FETCHER_HPP

#include <chrono>

#include "base/logger.hpp"
#include "network/block_fetcher.hpp"
#include "network/block_path.hpp"

namespace blockwatch::network
{
    /**
     * Fetches archive blocks over http(s) with a synchronous Boost.Beast
     * client, or from the local filesystem for file:// URLs.
     * Every call uses its own io_context and socket, so a single instance is
     * shared by all fetch workers.
     */
    class ArchiveBlockFetcher : public BlockFetcher
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultRequestTimeout{ 30000 };

        explicit ArchiveBlockFetcher( std::set<primitives::SourceUrl> source_urls,
                                      std::chrono::milliseconds       request_timeout = kDefaultRequestTimeout );

        ~ArchiveBlockFetcher() override = default;

        const std::set<primitives::SourceUrl> &sourceUrls() const override
        {
            return source_urls_;
        }

        outcome::result<primitives::BlockMaterial> fetchBlock( const std::string &url ) const override;

        /**
         * Retrieve the raw document at the URL without decoding it
         */
        outcome::result<std::string> fetchDocument( const std::string &url ) const;

    private:
        outcome::result<std::string> httpGet( const Url &url ) const;
        outcome::result<std::string> readFile( const Url &url ) const;

        std::set<primitives::SourceUrl> source_urls_;
        std::chrono::milliseconds       request_timeout_;
        base::Logger                    logger_;
    };
} // namespace blockwatch::network

#endif // BLOCKWATCH_NETWORK_ARCHIVE_BLOCK_FETCHER_HPP
