#include "ledger/impl/archive_directory_ledger.hpp"

#include <boost/filesystem/operations.hpp>

#include "ledger/ledger_error.hpp"
#include "network/block_path.hpp"

namespace blockwatch::ledger
{
    namespace fs = boost::filesystem;

    ArchiveDirectoryLedger::ArchiveDirectoryLedger( fs::path root ) :
        root_( std::move( root ) ), logger_( base::createLogger( "ArchiveDirectoryLedger" ) )
    {
    }

    bool ArchiveDirectoryLedger::hasBlock( primitives::BlockIndex index ) const
    {
        boost::system::error_code ec;
        return fs::is_regular_file( root_ / network::blockIndexToPath( index ), ec );
    }

    outcome::result<primitives::BlockIndex> ArchiveDirectoryLedger::numBlocks() const
    {
        boost::system::error_code ec;
        if ( !fs::is_directory( root_, ec ) )
        {
            return LedgerError::LEDGER_NOT_FOUND;
        }

        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        previous = known_blocks_;
        while ( hasBlock( known_blocks_ ) )
        {
            ++known_blocks_;
        }
        if ( known_blocks_ != previous )
        {
            logger_->trace( "Ledger height {} -> {}", previous, known_blocks_ );
        }
        return known_blocks_;
    }
} // namespace blockwatch::ledger
