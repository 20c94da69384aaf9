#ifndef BLOCKWATCH_LEDGER_ARCHIVE_DIRECTORY_LEDGER_HPP
#define BLOCKWATCH_LEDGER_ARCHIVE_DIRECTORY_LEDGER_HPP

#include <mutex>

#include <boost/filesystem/path.hpp>

#include "base/logger.hpp"
#include "ledger/ledger.hpp"

namespace blockwatch::ledger
{
    /**
     * Ledger backed by a local block archive laid out like the remote
     * archives. The height is the number of consecutive block files
     * present from index 0. Blocks are never removed, so the height is
     * cached and only probed forward.
     */
    class ArchiveDirectoryLedger : public Ledger
    {
    public:
        explicit ArchiveDirectoryLedger( boost::filesystem::path root );

        outcome::result<primitives::BlockIndex> numBlocks() const override;

        const boost::filesystem::path &root() const
        {
            return root_;
        }

    private:
        bool hasBlock( primitives::BlockIndex index ) const;

        boost::filesystem::path        root_;
        mutable std::mutex             mutex_;
        mutable primitives::BlockIndex known_blocks_ = 0;
        base::Logger                   logger_;
    };
} // namespace blockwatch::ledger

#endif // BLOCKWATCH_LEDGER_ARCHIVE_DIRECTORY_LEDGER_HPP
