#include "base/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace blockwatch::base;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then lowercase hex is produced
 */
TEST(Hexutil, HexLower) {
  std::vector<uint8_t> bin{0, 1, 2, 4, 8, 16, 32, 255};
  EXPECT_EQ(hex_lower(bin), "00010204081020ff"s);
  EXPECT_EQ(hex_lower(std::vector<uint8_t>{}), ""s);
}

/**
 * @given Hexencoded strings in both cases
 * @when unhex
 * @then both decode to the same bytes
 */
TEST(Hexutil, UnhexAnyCase) {
  EXPECT_OUTCOME_TRUE(lower, unhex("00010204081020ff"));
  EXPECT_OUTCOME_TRUE(upper, unhex("00010204081020FF"));
  EXPECT_EQ(lower, (std::vector<uint8_t>{0, 1, 2, 4, 8, 16, 32, 255}));
  EXPECT_EQ(lower, upper);
}

/**
 * @given Hexencoded string with 0x prefix
 * @when unhex
 * @then the prefix is skipped
 */
TEST(Hexutil, UnhexSkipsPrefix) {
  EXPECT_OUTCOME_TRUE(actual, unhex("0xdead"));
  EXPECT_EQ(actual, "dead"_unhex);
  EXPECT_OUTCOME_TRUE(empty, unhex("0x"));
  EXPECT_TRUE(empty.empty());
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Hexutil, UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(unhex("0xabc"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Hexutil, UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}
