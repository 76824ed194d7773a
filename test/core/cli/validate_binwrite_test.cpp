/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/validate/binwrite.hpp"

#include <gtest/gtest.h>

#include "codec/binwrite/binwrite.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using bw::codec::binwrite::encodeToBytes;
using bw::codec::binwrite::Endian;
using bw::codec::binwrite::parsePrimitive;
using bw::codec::binwrite::PrimitiveType;

/// Encodes parsed value big endian
bw::Bytes parsedBytes(PrimitiveType type, const std::string &str) {
  auto value{parsePrimitive(type, str)};
  EXPECT_TRUE(value) << str;
  if (!value) {
    return {};
  }
  return encodeToBytes(*value, Endian::kBig).value();
}

/**
 * @given numbers within range of type
 * @when parsed
 * @then value of that type
 */
TEST(ParsePrimitive, InRange) {
  EXPECT_EQ(parsedBytes(PrimitiveType::kU8, "255"), "FF"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kI8, "-128"), "80"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kU16, "258"), "0102"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kI32, "-2"), "FFFFFFFE"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kU64, "18446744073709551615"),
            "FFFFFFFFFFFFFFFF"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kF32, "1"), "3F800000"_unhex);
  EXPECT_EQ(parsedBytes(PrimitiveType::kF64, "-0.5"), "BFE0000000000000"_unhex);
}

/**
 * @given negative numbers for unsigned types
 * @when parsed
 * @then rejected instead of wrapped
 */
TEST(ParsePrimitive, NegativeUnsigned) {
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU8, "-1"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU32, "-4294967295"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU64, "-1"));
}

/**
 * @given numbers out of type range and non numbers
 * @when parsed
 * @then rejected
 */
TEST(ParsePrimitive, OutOfRange) {
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU8, "256"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kI8, "128"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kI8, "-129"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kI16, "40000"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU64, "18446744073709551616"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kF32, "1e300"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kU16, "12ab"));
  EXPECT_FALSE(parsePrimitive(PrimitiveType::kI32, ""));
}
