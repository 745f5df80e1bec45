/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/twox/twox.hpp"

#include <gtest/gtest.h>

#include "common/buffer.hpp"

using rampart::common::Buffer;
using rampart::crypto::make_twox256;

/**
 * @given well-known inputs
 * @when twox256 of them is computed
 * @then its first two lanes are the well-known twox128 of the inputs
 */
TEST(Twox256, FirstLanesAreTwox128) {
  auto empty = make_twox256(Buffer{});
  EXPECT_EQ(empty.toHex().substr(0, 32), "99e9d85137db46ef4bbea33613baafd5");

  auto system = make_twox256(Buffer{}.put("System"));
  EXPECT_EQ(system.toHex().substr(0, 32), "26aa394eea5630e07c48ae0c9558cef7");
}

/**
 * @given two different inputs
 * @when twox256 of them is computed
 * @then digests differ, while digests of equal inputs are equal
 */
TEST(Twox256, Deterministic) {
  auto a = make_twox256(Buffer{}.put("Balances"));
  auto b = make_twox256(Buffer{}.put("Balances"));
  auto c = make_twox256(Buffer{}.put("Balance"));
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}
