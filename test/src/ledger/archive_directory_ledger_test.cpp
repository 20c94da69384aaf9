#include "ledger/impl/archive_directory_ledger.hpp"

#include <gtest/gtest.h>

#include "ledger/ledger_error.hpp"
#include "network/block_path.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using blockwatch::ledger::ArchiveDirectoryLedger;
using blockwatch::ledger::LedgerError;
using blockwatch::network::blockIndexToPath;

struct ArchiveDirectoryLedgerTest : public test::FSFixture {
  ArchiveDirectoryLedgerTest()
      : test::FSFixture("blockwatch_archive_directory_ledger_test") {}

  void addBlock(blockwatch::primitives::BlockIndex index) {
    writeFile(blockIndexToPath(index), "{}");
  }
};

/**
 * @given an empty ledger directory
 * @when asking for the number of blocks
 * @then it is 0
 */
TEST_F(ArchiveDirectoryLedgerTest, EmptyLedger) {
  ArchiveDirectoryLedger ledger(base_path);
  EXPECT_OUTCOME_TRUE(blocks, ledger.numBlocks());
  EXPECT_EQ(blocks, 0);
}

/**
 * @given blocks 0 to 2 and block 4
 * @when asking for the number of blocks
 * @then only the consecutive blocks from 0 are counted
 */
TEST_F(ArchiveDirectoryLedgerTest, CountsConsecutiveBlocks) {
  addBlock(0);
  addBlock(1);
  addBlock(2);
  addBlock(4);
  ArchiveDirectoryLedger ledger(base_path);
  EXPECT_OUTCOME_TRUE(blocks, ledger.numBlocks());
  EXPECT_EQ(blocks, 3);
}

/**
 * @given a ledger that already counted its blocks
 * @when the missing block appears
 * @then the count grows past the gap
 */
TEST_F(ArchiveDirectoryLedgerTest, GrowsWhenBlocksAppear) {
  addBlock(0);
  addBlock(2);
  ArchiveDirectoryLedger ledger(base_path);
  EXPECT_OUTCOME_TRUE(before, ledger.numBlocks());
  EXPECT_EQ(before, 1);

  addBlock(1);
  EXPECT_OUTCOME_TRUE(after, ledger.numBlocks());
  EXPECT_EQ(after, 3);
}

/**
 * @given a ledger directory that does not exist
 * @when asking for the number of blocks
 * @then LEDGER_NOT_FOUND is returned
 */
TEST_F(ArchiveDirectoryLedgerTest, MissingDirectory) {
  ArchiveDirectoryLedger ledger(base_path / "missing");
  EXPECT_EC(ledger.numBlocks(), LedgerError::LEDGER_NOT_FOUND);
}
