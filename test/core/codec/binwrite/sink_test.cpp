/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/sink.hpp"

#include <sstream>

#include <gtest/gtest.h>

#include "codec/binwrite/binwrite.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/codec/binwrite/sink_mock.hpp"
#include "testutil/outcome.hpp"

using bw::Bytes;
using bw::codec::binwrite::BinwriteError;
using bw::codec::binwrite::BoundedSink;
using bw::codec::binwrite::BytesSink;
using bw::codec::binwrite::encode;
using bw::codec::binwrite::Endian;
using bw::codec::binwrite::OstreamSink;
using bw::codec::binwrite::SinkMock;
using bw::codec::binwrite::write;
using bw::codec::binwrite::WriteTrack;
using testing::_;
using testing::Return;

namespace outcome = bw::outcome;

/**
 * @given sink rejecting third write
 * @when composite of four primitives is encoded
 * @then first two writes are issued, failure is returned unchanged and no
 * further write is issued
 */
TEST(BinwriteSink, FailFast) {
  auto error{std::make_error_code(std::errc::io_error)};
  SinkMock sink;
  testing::InSequence seq;
  EXPECT_CALL(sink, doAccept("01"_unhex)).WillOnce(Return(outcome::success()));
  EXPECT_CALL(sink, doAccept("0002"_unhex))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(sink, doAccept("00000003"_unhex))
      .WillOnce(Return(outcome::failure(error)));
  auto result{encode(
      std::make_tuple(uint8_t{1}, uint16_t{2}, uint32_t{3}, uint8_t{4}),
      sink,
      Endian::kBig)};
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), error);
}

/**
 * @given mock sink
 * @when primitives are encoded
 * @then each primitive is exactly one write of its width
 */
TEST(BinwriteSink, OneWritePerPrimitive) {
  SinkMock sink;
  testing::InSequence seq;
  EXPECT_CALL(sink, doAccept("FEFFFFFF"_unhex))
      .WillOnce(Return(outcome::success()));
  EXPECT_CALL(sink, doAccept("0000000000000840"_unhex))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_TRUE_1(
      encode(std::make_pair(int32_t{-2}, 3.0), sink, Endian::kLittle));
}

/**
 * @given sink with capacity
 * @when write exceeds remaining capacity
 * @then whole write is rejected, earlier writes are kept
 */
TEST(BinwriteSink, Bounded) {
  Bytes out;
  BytesSink bytes{out};
  BoundedSink sink{bytes, 5};
  EXPECT_OUTCOME_TRUE_1(write(uint32_t{0}, sink));
  EXPECT_EQ(sink.remaining(), 1u);
  EXPECT_OUTCOME_ERROR(BinwriteError::kSinkCapacityExceeded,
                       write(uint16_t{0}, sink));
  EXPECT_EQ(out.size(), 4u);
  EXPECT_OUTCOME_TRUE_1(write(uint8_t{0}, sink));
  EXPECT_EQ(sink.remaining(), 0u);
}

/**
 * @given tracking sink
 * @when values are written
 * @then position counts forwarded bytes
 */
TEST(BinwriteSink, WriteTrack) {
  BytesSink bytes;
  WriteTrack track{bytes};
  EXPECT_EQ(track.position(), 0u);
  EXPECT_OUTCOME_TRUE_1(write(std::make_tuple(uint8_t{1}, uint64_t{2}), track));
  EXPECT_EQ(track.position(), 9u);
  EXPECT_EQ(bytes.data().size(), 9u);
}

/// Failed inner write is not counted
TEST(BinwriteSink, WriteTrackFailure) {
  SinkMock inner;
  WriteTrack track{inner};
  EXPECT_CALL(inner, doAccept(_))
      .WillOnce(Return(outcome::failure(
          make_error_code(BinwriteError::kSinkIoFailure))));
  EXPECT_OUTCOME_ERROR(BinwriteError::kSinkIoFailure,
                       write(uint16_t{1}, track));
  EXPECT_EQ(track.position(), 0u);
}

/**
 * @given output stream
 * @when value is written
 * @then stream holds encoded bytes, bad stream fails
 */
TEST(BinwriteSink, Ostream) {
  std::ostringstream os;
  OstreamSink sink{os};
  EXPECT_OUTCOME_TRUE_1(encode(uint16_t{0x4142}, sink, Endian::kBig));
  EXPECT_EQ(os.str(), "AB");
  os.setstate(std::ios::badbit);
  EXPECT_OUTCOME_ERROR(BinwriteError::kSinkIoFailure,
                       encode(uint16_t{0x4142}, sink, Endian::kBig));
}

/// Borrowed buffer is appended, owned buffer starts empty
TEST(BinwriteSink, BytesSink) {
  BytesSink owned;
  EXPECT_TRUE(owned.data().empty());
  Bytes out{"01"_unhex};
  BytesSink borrowed{out};
  EXPECT_OUTCOME_TRUE_1(write(uint8_t{2}, borrowed));
  EXPECT_EQ(out, "0102"_unhex);
  EXPECT_EQ(&borrowed.data(), &out);
}
