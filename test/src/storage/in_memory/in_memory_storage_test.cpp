#include "storage/in_memory/in_memory_storage.hpp"

#include <gtest/gtest.h>

#include "storage/database_error.hpp"
#include "testutil/outcome.hpp"

using blockwatch::storage::DatabaseError;
using blockwatch::storage::InMemoryStorage;

/**
 * @given an empty storage
 * @when putting, reading and removing a value
 * @then the value is visible until it is removed
 */
TEST(InMemoryStorageTest, PutGetRemove) {
  InMemoryStorage storage;
  EXPECT_TRUE(storage.empty());
  EXPECT_EC(storage.get("key"), DatabaseError::NOT_FOUND);

  EXPECT_OUTCOME_TRUE_1(storage.put("key", "value"));
  EXPECT_FALSE(storage.empty());
  EXPECT_TRUE(storage.contains("key"));
  EXPECT_OUTCOME_TRUE(value, storage.get("key"));
  EXPECT_EQ(value, "value");

  EXPECT_OUTCOME_TRUE_1(storage.remove("key"));
  EXPECT_FALSE(storage.contains("key"));
}

/**
 * @given keys sharing a prefix with other keys around them
 * @when querying the prefix
 * @then only the keys with the prefix are returned
 */
TEST(InMemoryStorageTest, QueryByPrefix) {
  InMemoryStorage storage;
  EXPECT_OUTCOME_TRUE_1(storage.put("sig/1/a", "1a"));
  EXPECT_OUTCOME_TRUE_1(storage.put("sig/1/b", "1b"));
  EXPECT_OUTCOME_TRUE_1(storage.put("sig/10/a", "10a"));
  EXPECT_OUTCOME_TRUE_1(storage.put("sig/0", "0"));

  EXPECT_OUTCOME_TRUE(result, storage.query("sig/1/"));
  EXPECT_EQ(result.size(), 2);
  EXPECT_EQ(result.at("sig/1/a"), "1a");
  EXPECT_EQ(result.at("sig/1/b"), "1b");
}

/**
 * @given a batch with pending changes
 * @when it is cleared or committed
 * @then cleared changes are dropped and committed ones are applied together
 */
TEST(InMemoryStorageTest, BatchIsAppliedOnCommitOnly) {
  InMemoryStorage storage;
  EXPECT_OUTCOME_TRUE_1(storage.put("old", "1"));

  auto batch = storage.batch();
  EXPECT_OUTCOME_TRUE_1(batch->put("dropped", "1"));
  batch->clear();
  EXPECT_OUTCOME_TRUE_1(batch->put("new", "2"));
  EXPECT_OUTCOME_TRUE_1(batch->remove("old"));
  EXPECT_FALSE(storage.contains("new"));

  EXPECT_OUTCOME_TRUE_1(batch->commit());
  EXPECT_TRUE(storage.contains("new"));
  EXPECT_FALSE(storage.contains("old"));
  EXPECT_FALSE(storage.contains("dropped"));
}
