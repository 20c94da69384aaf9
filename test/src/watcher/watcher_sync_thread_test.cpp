#include "watcher/watcher_sync_thread.hpp"

#include <atomic>
#include <map>

#include <gtest/gtest.h>

#include "ledger/ledger_error.hpp"
#include "mock/src/ledger/ledger_mock.hpp"
#include "mock/src/network/block_fetcher_mock.hpp"
#include "mock/src/watcher/watcher_db_mock.hpp"
#include "network/fetcher_error.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"
#include "testutil/watcher/block_materials.hpp"
#include "watcher/impl/key_value_watcher_db.hpp"
#include "watcher/watcher_error.hpp"

using blockwatch::ledger::LedgerError;
using blockwatch::ledger::LedgerMock;
using blockwatch::network::BlockFetcherMock;
using blockwatch::network::FetcherError;
using blockwatch::primitives::BlockIndex;
using blockwatch::primitives::BlockMaterial;
using blockwatch::primitives::SourceUrl;
using blockwatch::storage::InMemoryStorage;
using blockwatch::test::blockUrl;
using blockwatch::test::makeBlock;
using namespace blockwatch::watcher;
using namespace std::chrono_literals;
using testing::_;
using testing::Invoke;
using testing::Return;
using testing::ReturnRef;

class WatcherSyncThreadTest : public testing::Test {
 public:
  const SourceUrl kSourceA = "http://archive-a.test/";
  const SourceUrl kSourceB = "http://archive-b.test/";

  void SetUp() override {
    sources_ = {kSourceA, kSourceB};
    fetcher_ = std::make_shared<BlockFetcherMock>();
    ledger_ = std::make_shared<LedgerMock>();
    ON_CALL(*fetcher_, sourceUrls()).WillByDefault(ReturnRef(sources_));
    ON_CALL(*fetcher_, fetchBlock(_))
        .WillByDefault(Invoke([this](const std::string &url) {
          return servedBlock(url);
        }));
    db_ = KeyValueWatcherDb::create(std::make_shared<InMemoryStorage>(),
                                    sources_)
              .value();
  }

  void publish(const SourceUrl &src, BlockIndex first, BlockIndex last) {
    for (auto index = first; index <= last; ++index) {
      served_[blockUrl(src, index)] = makeBlock(src, index);
    }
  }

  std::unique_ptr<WatcherSyncThread> start(
      std::chrono::milliseconds poll_interval = 10ms) {
    return WatcherSyncThread::create(
               db_, fetcher_, ledger_, poll_interval, false)
        .value();
  }

  std::optional<BlockIndex> cursor(const SourceUrl &src) const {
    return db_->lastSyncedBlocks().value().at(src);
  }

 private:
  outcome::result<BlockMaterial> servedBlock(const std::string &url) {
    requested_urls_.fetch_add(1);
    if (url == blockUrl(kSourceA, 6)) {
      source_a_asked_for_6_ = true;
    }
    if (url == blockUrl(kSourceB, 0)) {
      source_b_asked_for_0_ = true;
    }
    auto it = served_.find(url);
    if (it == served_.end()) {
      return FetcherError::NOT_FOUND;
    }
    return it->second;
  }

 protected:
  std::set<SourceUrl> sources_;
  std::map<std::string, BlockMaterial> served_;
  std::shared_ptr<BlockFetcherMock> fetcher_;
  std::shared_ptr<LedgerMock> ledger_;
  std::shared_ptr<KeyValueWatcherDb> db_;

  std::atomic<size_t> requested_urls_{0};
  std::atomic<bool> source_a_asked_for_6_{false};
  std::atomic<bool> source_b_asked_for_0_{false};
};

/**
 * @given source A synced up to 5, source B never synced, ledger at 10 blocks
 * @when the sync thread runs
 * @then it reports being behind and asks A for block 6 and B for block 0
 */
TEST_F(WatcherSyncThreadTest, ReportsBehindLedger) {
  ASSERT_TRUE(db_->updateLastSynced(kSourceA, 5));
  ON_CALL(*ledger_, numBlocks()).WillByDefault(Return(BlockIndex{10}));

  auto sync_thread = start();
  ASSERT_WAIT_FOR_CONDITION(
      [&] {
        return sync_thread->isBehind() && source_a_asked_for_6_
               && source_b_asked_for_0_;
      },
      5000ms,
      "sync thread behind ledger",
      nullptr);

  sync_thread->stop();
  EXPECT_EQ(sync_thread->state(), WatcherSyncThread::State::kStopped);
  EXPECT_TRUE(sync_thread->isBehind());
  EXPECT_FALSE(sync_thread->lastError());
}

/**
 * @given archives holding every block of a 5 block ledger
 * @when the sync thread runs
 * @then all sources are synced and the thread reports being caught up
 */
TEST_F(WatcherSyncThreadTest, CatchesUpWithLedger) {
  publish(kSourceA, 0, 4);
  publish(kSourceB, 0, 4);
  ON_CALL(*ledger_, numBlocks()).WillByDefault(Return(BlockIndex{5}));

  auto sync_thread = start();
  ASSERT_WAIT_FOR_CONDITION(
      [&] {
        return cursor(kSourceA) == BlockIndex{4}
               && cursor(kSourceB) == BlockIndex{4}
               && !sync_thread->isBehind();
      },
      5000ms,
      "sources synced up to the ledger",
      nullptr);

  EXPECT_OUTCOME_TRUE(lowest,
                      sync_thread->watcher()->lowestNextBlockToSync());
  EXPECT_EQ(lowest, 5);
  EXPECT_EQ(sync_thread->state(), WatcherSyncThread::State::kRunning);
}

/**
 * @given a ledger reporting 100 blocks once and failing afterwards
 * @when the sync thread runs
 * @then the single sync iteration stops at block 10 and the ledger error
 * terminates the thread
 */
TEST_F(WatcherSyncThreadTest, IterationIsBoundedAndLedgerErrorIsFatal) {
  publish(kSourceA, 0, 99);
  publish(kSourceB, 0, 99);
  EXPECT_CALL(*ledger_, numBlocks())
      .WillOnce(Return(BlockIndex{100}))
      .WillRepeatedly(Return(LedgerError::LEDGER_NOT_FOUND));

  auto sync_thread = start();
  ASSERT_WAIT_FOR_CONDITION(
      [&] {
        return sync_thread->state() == WatcherSyncThread::State::kStopped;
      },
      5000ms,
      "sync thread terminated",
      nullptr);

  EXPECT_EQ(cursor(kSourceA),
            BlockIndex{WatcherSyncThread::kMaxBlocksPerSyncIteration});
  EXPECT_EQ(cursor(kSourceB),
            BlockIndex{WatcherSyncThread::kMaxBlocksPerSyncIteration});
  ASSERT_TRUE(sync_thread->lastError());
  EXPECT_EQ(*sync_thread->lastError(),
            make_error_code(LedgerError::LEDGER_NOT_FOUND));
  EXPECT_TRUE(sync_thread->isBehind());
}

/**
 * @given a caught up sync thread waiting for a long poll interval
 * @when stopping it twice
 * @then the first stop wakes and joins the thread, the second does nothing
 */
TEST_F(WatcherSyncThreadTest, StopInterruptsPollWait) {
  std::atomic<bool> ledger_polled{false};
  ON_CALL(*ledger_, numBlocks()).WillByDefault(Invoke([&ledger_polled] {
    ledger_polled = true;
    return outcome::result<BlockIndex>(BlockIndex{0});
  }));

  auto sync_thread = start(60s);
  ASSERT_WAIT_FOR_CONDITION(
      [&] { return ledger_polled.load(); }, 5000ms, "ledger polled", nullptr);

  auto started = std::chrono::steady_clock::now();
  sync_thread->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
  EXPECT_EQ(sync_thread->state(), WatcherSyncThread::State::kStopped);

  sync_thread->stop();
  EXPECT_EQ(sync_thread->state(), WatcherSyncThread::State::kStopped);
  EXPECT_FALSE(sync_thread->isBehind());
}

/**
 * @given a running sync thread
 * @when it is destroyed
 * @then the thread is stopped and no more fetches happen afterwards
 */
TEST_F(WatcherSyncThreadTest, DestructionStopsThread) {
  ON_CALL(*ledger_, numBlocks()).WillByDefault(Return(BlockIndex{10}));

  auto sync_thread = start();
  ASSERT_WAIT_FOR_CONDITION(
      [&] { return requested_urls_ > 0; }, 5000ms, "first fetch", nullptr);
  sync_thread.reset();

  auto requested = requested_urls_.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(requested_urls_.load(), requested);
}

/**
 * @given a database failing to read cursors
 * @when the sync thread runs
 * @then it terminates with the database error and never reports being
 * behind
 */
TEST_F(WatcherSyncThreadTest, DatabaseErrorIsFatal) {
  auto db = std::make_shared<WatcherDbMock>();
  EXPECT_CALL(*db, getConfigUrls()).WillOnce(Return(sources_));
  EXPECT_CALL(*db, lastSyncedBlocks())
      .WillOnce(Return(blockwatch::storage::DatabaseError::IO_ERROR));
  EXPECT_CALL(*ledger_, numBlocks()).Times(0);

  EXPECT_OUTCOME_TRUE(
      sync_thread,
      WatcherSyncThread::create(db, fetcher_, ledger_, 10ms, false));
  ASSERT_WAIT_FOR_CONDITION(
      [&] {
        return sync_thread->state() == WatcherSyncThread::State::kStopped;
      },
      5000ms,
      "sync thread terminated",
      nullptr);

  ASSERT_TRUE(sync_thread->lastError());
  EXPECT_EQ(*sync_thread->lastError(),
            make_error_code(blockwatch::storage::DatabaseError::IO_ERROR));
  EXPECT_FALSE(sync_thread->isBehind());
}

/**
 * @given fetcher and database watching different sources
 * @when creating a sync thread
 * @then creation fails and no thread is started
 */
TEST_F(WatcherSyncThreadTest, CreateFailsOnSourceSetMismatch) {
  std::set<SourceUrl> other = {kSourceA};
  EXPECT_CALL(*fetcher_, sourceUrls()).WillRepeatedly(ReturnRef(other));
  EXPECT_CALL(*ledger_, numBlocks()).Times(0);

  EXPECT_EC(WatcherSyncThread::create(db_, fetcher_, ledger_, 10ms, false),
            WatcherError::SOURCE_SET_MISMATCH);
}
