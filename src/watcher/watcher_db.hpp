#ifndef BLOCKWATCH_WATCHER_DB_HPP
#define BLOCKWATCH_WATCHER_DB_HPP

#include <map>
#include <optional>
#include <set>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/block_material.hpp"

namespace blockwatch::watcher
{
    /**
     * Durable record of what the watcher collected from every source: the
     * last synced block index per source, signatures and optionally the raw
     * block material. Implementations must be safe for concurrent use.
     */
    class WatcherDb
    {
    public:
        /// Source URL to the index of the last block synced from it, if any
        using LastSyncedMap = std::map<primitives::SourceUrl, std::optional<primitives::BlockIndex>>;

        virtual ~WatcherDb() = default;

        /**
         * @return source URLs the database was opened with
         */
        virtual outcome::result<std::set<primitives::SourceUrl>> getConfigUrls() const = 0;

        /**
         * @return last synced block of every configured source
         */
        virtual outcome::result<LastSyncedMap> lastSyncedBlocks() const = 0;

        /**
         * Store the fetched block of a source
         * @return WatcherDbError::ALREADY_EXISTS if the block of this source
         * was stored before
         */
        virtual outcome::result<void> addBlockData( const primitives::SourceUrl     &src_url,
                                                    const primitives::BlockMaterial &material ) = 0;

        /**
         * Store the signature of a block and mark the block as the last
         * synced one of the source
         * @param archive_filename canonical path of the block
         */
        virtual outcome::result<void> addBlockSignature( const primitives::SourceUrl      &src_url,
                                                         primitives::BlockIndex            block_index,
                                                         const primitives::BlockSignature &signature,
                                                         const std::string                &archive_filename ) = 0;

        /**
         * Mark a block without signature as the last synced one of the
         * source. A cursor never moves backwards.
         */
        virtual outcome::result<void> updateLastSynced( const primitives::SourceUrl &src_url,
                                                        primitives::BlockIndex       block_index ) = 0;

        /**
         * @return signatures collected for the block from all sources
         */
        virtual outcome::result<std::vector<primitives::BlockSignatureData>> getBlockSignatures(
            primitives::BlockIndex block_index ) const = 0;

        /**
         * @return stored block of the source or WatcherDbError::NOT_FOUND
         */
        virtual outcome::result<primitives::BlockMaterial> getBlockData( const primitives::SourceUrl &src_url,
                                                                         primitives::BlockIndex block_index ) const = 0;
    };
} // namespace blockwatch::watcher

#endif // BLOCKWATCH_WATCHER_DB_HPP
