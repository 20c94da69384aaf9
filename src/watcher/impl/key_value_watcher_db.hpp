#ifndef BLOCKWATCH_KEY_VALUE_WATCHER_DB_HPP
#define BLOCKWATCH_KEY_VALUE_WATCHER_DB_HPP

#include <mutex>

#include "base/logger.hpp"
#include "storage/key_value_storage.hpp"
#include "watcher/watcher_db.hpp"

namespace blockwatch::watcher
{
    /**
     * WatcherDb kept in a key-value storage (RocksDB or in memory).
     *
     * Layout:
     *   cfg/<url>                  configured source
     *   last/<url>                 last synced index, decimal
     *   sig/<index>/<url>          signature record, JSON
     *   blk/<url>/<index>          block material, archive JSON
     * Indices in keys are zero padded to 20 digits so that keys sort by index.
     */
    class KeyValueWatcherDb : public WatcherDb
    {
    public:
        /**
         * Open the watcher database over the storage. The configured source
         * set is replaced by src_urls, cursors of sources kept from a
         * previous run are preserved.
         */
        static outcome::result<std::shared_ptr<KeyValueWatcherDb>> create(
            std::shared_ptr<storage::KeyValueStorage> storage,
            const std::set<primitives::SourceUrl>    &src_urls );

        ~KeyValueWatcherDb() override = default;

        outcome::result<std::set<primitives::SourceUrl>> getConfigUrls() const override;

        outcome::result<LastSyncedMap> lastSyncedBlocks() const override;

        outcome::result<void> addBlockData( const primitives::SourceUrl     &src_url,
                                            const primitives::BlockMaterial &material ) override;

        outcome::result<void> addBlockSignature( const primitives::SourceUrl      &src_url,
                                                 primitives::BlockIndex            block_index,
                                                 const primitives::BlockSignature &signature,
                                                 const std::string                &archive_filename ) override;

        outcome::result<void> updateLastSynced( const primitives::SourceUrl &src_url,
                                                primitives::BlockIndex       block_index ) override;

        outcome::result<std::vector<primitives::BlockSignatureData>> getBlockSignatures(
            primitives::BlockIndex block_index ) const override;

        outcome::result<primitives::BlockMaterial> getBlockData( const primitives::SourceUrl &src_url,
                                                                 primitives::BlockIndex       block_index ) const override;

    private:
        explicit KeyValueWatcherDb( std::shared_ptr<storage::KeyValueStorage> storage );

        outcome::result<void> storeConfigUrls( const std::set<primitives::SourceUrl> &src_urls );

        /// callers hold mutex_
        outcome::result<std::set<primitives::SourceUrl>>       readConfigUrls() const;
        outcome::result<std::optional<primitives::BlockIndex>> readLastSynced( const primitives::SourceUrl &src_url ) const;
        /// read errors other than NOT_FOUND are returned, not taken as absence
        outcome::result<bool>                                  hasKey( const std::string &key ) const;
        outcome::result<void>                                  ensureConfigured( const primitives::SourceUrl &src_url ) const;

        std::shared_ptr<storage::KeyValueStorage> storage_;
        mutable std::mutex                        mutex_;
        base::Logger                              logger_;
    };
} // namespace blockwatch::watcher

#endif // BLOCKWATCH_KEY_VALUE_WATCHER_DB_HPP
