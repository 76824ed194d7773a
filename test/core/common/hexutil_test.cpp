/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using bw::Bytes;
using bw::common::hex_lower;
using bw::common::unhex;
using bw::common::UnhexError;

/**
 * @given bytes
 * @when hex encoded
 * @then two lowercase digits per byte
 */
TEST(Hexutil, Hex) {
  Bytes bytes{0x00, 0xAB, 0x7F};
  EXPECT_EQ(hex_lower(bytes), "00ab7f");
  EXPECT_EQ(hex_lower(Bytes{}), "");
}

/**
 * @given hex string
 * @when unhexed
 * @then bytes or error for odd length and non hex digits
 */
TEST(Hexutil, Unhex) {
  EXPECT_OUTCOME_EQ(unhex("00ab7F"), (Bytes{0x00, 0xAB, 0x7F}));
  EXPECT_OUTCOME_EQ(unhex(""), Bytes{});
  EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, unhex("ABC"));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("0G"));
}
