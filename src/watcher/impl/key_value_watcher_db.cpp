#include "watcher/impl/key_value_watcher_db.hpp"

#include <sstream>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <spdlog/fmt/fmt.h>

#include "network/block_material_codec.hpp"
#include "storage/database_error.hpp"
#include "watcher/watcher_db_error.hpp"

namespace blockwatch::watcher
{
    namespace pt = boost::property_tree;
    using primitives::BlockIndex;
    using primitives::SourceUrl;

    namespace
    {
        const std::string kConfigPrefix     = "cfg/";
        const std::string kLastSyncedPrefix = "last/";
        const std::string kSignaturePrefix  = "sig/";
        const std::string kBlockDataPrefix  = "blk/";

        std::string indexKeyPart( BlockIndex index )
        {
            return fmt::format( "{:020}", index );
        }

        std::string signaturePrefix( BlockIndex index )
        {
            return kSignaturePrefix + indexKeyPart( index ) + "/";
        }

        std::string signatureKey( BlockIndex index, const SourceUrl &src_url )
        {
            return signaturePrefix( index ) + src_url;
        }

        std::string blockDataKey( const SourceUrl &src_url, BlockIndex index )
        {
            return kBlockDataPrefix + src_url + "/" + indexKeyPart( index );
        }

        outcome::result<pt::ptree> parseRecord( const std::string &record )
        {
            pt::ptree tree;
            try
            {
                std::istringstream in( record );
                pt::read_json( in, tree );
            }
            catch ( const pt::json_parser_error & )
            {
                return WatcherDbError::CORRUPTED_RECORD;
            }
            return tree;
        }

        std::string writeRecord( const pt::ptree &tree )
        {
            std::ostringstream out;
            pt::write_json( out, tree, false );
            return out.str();
        }
    } // namespace

    KeyValueWatcherDb::KeyValueWatcherDb( std::shared_ptr<storage::KeyValueStorage> storage ) :
        storage_( std::move( storage ) ), logger_( base::createLogger( "KeyValueWatcherDb" ) )
    {
    }

    outcome::result<std::shared_ptr<KeyValueWatcherDb>> KeyValueWatcherDb::create(
        std::shared_ptr<storage::KeyValueStorage> storage,
        const std::set<SourceUrl>                &src_urls )
    {
        // constructor is private, so make_shared is not available
        std::shared_ptr<KeyValueWatcherDb> db( new KeyValueWatcherDb( std::move( storage ) ) );
        OUTCOME_TRY( db->storeConfigUrls( src_urls ) );
        return db;
    }

    outcome::result<void> KeyValueWatcherDb::storeConfigUrls( const std::set<SourceUrl> &src_urls )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( current, readConfigUrls() );

        auto batch = storage_->batch();
        for ( const auto &url : current )
        {
            if ( src_urls.count( url ) == 0 )
            {
                logger_->info( "Source {} is no longer watched", url );
                OUTCOME_TRY( batch->remove( kConfigPrefix + url ) );
            }
        }
        for ( const auto &url : src_urls )
        {
            OUTCOME_TRY( batch->put( kConfigPrefix + url, "" ) );
        }
        return batch->commit();
    }

    outcome::result<std::set<SourceUrl>> KeyValueWatcherDb::readConfigUrls() const
    {
        OUTCOME_TRY( entries, storage_->query( kConfigPrefix ) );
        std::set<SourceUrl> urls;
        for ( const auto &entry : entries )
        {
            urls.insert( entry.first.substr( kConfigPrefix.size() ) );
        }
        return urls;
    }

    outcome::result<std::optional<BlockIndex>> KeyValueWatcherDb::readLastSynced( const SourceUrl &src_url ) const
    {
        auto value = storage_->get( kLastSyncedPrefix + src_url );
        if ( !value )
        {
            if ( value.error() == storage::DatabaseError::NOT_FOUND )
            {
                return std::nullopt;
            }
            return value.error();
        }

        // lexical_cast wraps negative numbers into the unsigned range
        BlockIndex index = 0;
        if ( value.value().empty() || value.value().front() == '-' ||
             !boost::conversion::try_lexical_convert( value.value(), index ) )
        {
            logger_->error( "Corrupted last synced block of {}: '{}'", src_url, value.value() );
            return WatcherDbError::CORRUPTED_RECORD;
        }
        return index;
    }

    outcome::result<bool> KeyValueWatcherDb::hasKey( const std::string &key ) const
    {
        auto value = storage_->get( key );
        if ( value )
        {
            return true;
        }
        if ( value.error() == storage::DatabaseError::NOT_FOUND )
        {
            return false;
        }
        return value.error();
    }

    outcome::result<void> KeyValueWatcherDb::ensureConfigured( const SourceUrl &src_url ) const
    {
        OUTCOME_TRY( configured, hasKey( kConfigPrefix + src_url ) );
        if ( !configured )
        {
            return WatcherDbError::UNKNOWN_SOURCE_URL;
        }
        return outcome::success();
    }

    outcome::result<std::set<SourceUrl>> KeyValueWatcherDb::getConfigUrls() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return readConfigUrls();
    }

    outcome::result<WatcherDb::LastSyncedMap> KeyValueWatcherDb::lastSyncedBlocks() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( urls, readConfigUrls() );

        LastSyncedMap last_synced;
        for ( const auto &url : urls )
        {
            OUTCOME_TRY( index, readLastSynced( url ) );
            last_synced.emplace( url, index );
        }
        return last_synced;
    }

    outcome::result<void> KeyValueWatcherDb::addBlockData( const SourceUrl                 &src_url,
                                                           const primitives::BlockMaterial &material )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( ensureConfigured( src_url ) );

        auto key = blockDataKey( src_url, material.index );
        OUTCOME_TRY( exists, hasKey( key ) );
        if ( exists )
        {
            return WatcherDbError::ALREADY_EXISTS;
        }
        return storage_->put( key, network::encodeBlockMaterial( material ) );
    }

    outcome::result<void> KeyValueWatcherDb::addBlockSignature( const SourceUrl                  &src_url,
                                                                BlockIndex                        block_index,
                                                                const primitives::BlockSignature &signature,
                                                                const std::string                &archive_filename )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( ensureConfigured( src_url ) );
        OUTCOME_TRY( last_synced, readLastSynced( src_url ) );

        pt::ptree record;
        record.put( "src_url", src_url );
        record.put( "archive_filename", archive_filename );
        record.put_child( "signature", network::signatureToTree( signature ) );

        // the signature and the cursor move together
        auto batch = storage_->batch();
        OUTCOME_TRY( batch->put( signatureKey( block_index, src_url ), writeRecord( record ) ) );
        if ( !last_synced || block_index > *last_synced )
        {
            OUTCOME_TRY( batch->put( kLastSyncedPrefix + src_url, std::to_string( block_index ) ) );
        }
        return batch->commit();
    }

    outcome::result<void> KeyValueWatcherDb::updateLastSynced( const SourceUrl &src_url, BlockIndex block_index )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( ensureConfigured( src_url ) );
        OUTCOME_TRY( last_synced, readLastSynced( src_url ) );

        if ( last_synced && block_index <= *last_synced )
        {
            logger_->debug( "Last synced block of {} stays at {}, ignoring {}", src_url, *last_synced, block_index );
            return outcome::success();
        }
        return storage_->put( kLastSyncedPrefix + src_url, std::to_string( block_index ) );
    }

    outcome::result<std::vector<primitives::BlockSignatureData>> KeyValueWatcherDb::getBlockSignatures(
        BlockIndex block_index ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        OUTCOME_TRY( entries, storage_->query( signaturePrefix( block_index ) ) );

        std::vector<primitives::BlockSignatureData> signatures;
        signatures.reserve( entries.size() );
        for ( const auto &entry : entries )
        {
            OUTCOME_TRY( record, parseRecord( entry.second ) );

            auto src_url          = record.get_optional<std::string>( "src_url" );
            auto archive_filename = record.get_optional<std::string>( "archive_filename" );
            auto signature_tree   = record.get_child_optional( "signature" );
            if ( !src_url || !archive_filename || !signature_tree )
            {
                return WatcherDbError::CORRUPTED_RECORD;
            }
            auto signature = network::signatureFromTree( *signature_tree );
            if ( !signature )
            {
                return WatcherDbError::CORRUPTED_RECORD;
            }
            signatures.push_back( { *src_url, *archive_filename, std::move( signature.value() ) } );
        }
        return signatures;
    }

    outcome::result<primitives::BlockMaterial> KeyValueWatcherDb::getBlockData( const SourceUrl &src_url,
                                                                                BlockIndex       block_index ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        value = storage_->get( blockDataKey( src_url, block_index ) );
        if ( !value )
        {
            if ( value.error() == storage::DatabaseError::NOT_FOUND )
            {
                return WatcherDbError::NOT_FOUND;
            }
            return value.error();
        }

        auto material = network::decodeBlockMaterial( value.value() );
        if ( !material )
        {
            return WatcherDbError::CORRUPTED_RECORD;
        }
        return material;
    }
} // namespace blockwatch::watcher
