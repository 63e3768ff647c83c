#include "base/hexutil.hpp"

#include <array>
#include <vector>

#include <gtest/gtest.h>

using namespace calcflow::base;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_HexLower) {
  std::array<uint8_t, 8> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xFF};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff");
  ASSERT_EQ(hex_lower(std::vector<uint8_t>{}), "");
}

/**
 * @given strings with and without uppercase or non hex characters
 * @when checked
 * @then only lowercase hex digits pass
 */
TEST(Common, Hexutil_IsLowerHex) {
  EXPECT_TRUE(is_lower_hex("0123456789abcdef"));
  EXPECT_TRUE(is_lower_hex(""));
  EXPECT_FALSE(is_lower_hex("00FF"));
  EXPECT_FALSE(is_lower_hex("0x00"));
  EXPECT_FALSE(is_lower_hex("abc.txt"));
}
