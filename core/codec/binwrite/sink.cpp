/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/sink.hpp"

#include "common/logger.hpp"

namespace bw::codec::binwrite {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("binwrite_sink");
      return logger.get();
    }
  }  // namespace

  BytesSink::BytesSink() : out_{&own_} {}

  BytesSink::BytesSink(Bytes &out) : out_{&out} {}

  outcome::result<void> BytesSink::accept(BytesIn bytes) {
    append(*out_, bytes);
    return outcome::success();
  }

  const Bytes &BytesSink::data() const {
    return *out_;
  }

  OstreamSink::OstreamSink(std::ostream &os) : os_{os} {}

  outcome::result<void> OstreamSink::accept(BytesIn bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    os_.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!os_) {
      log()->warn("output stream failed writing {} bytes", bytes.size());
      return outcome::failure(BinwriteError::kSinkIoFailure);
    }
    return outcome::success();
  }

  BoundedSink::BoundedSink(Sink &inner, size_t capacity)
      : inner_{inner}, capacity_{capacity} {}

  outcome::result<void> BoundedSink::accept(BytesIn bytes) {
    const auto size{static_cast<size_t>(bytes.size())};
    if (size > remaining()) {
      return outcome::failure(BinwriteError::kSinkCapacityExceeded);
    }
    OUTCOME_TRY(inner_.accept(bytes));
    written_ += size;
    return outcome::success();
  }

  size_t BoundedSink::remaining() const {
    return capacity_ - written_;
  }

  WriteTrack::WriteTrack(Sink &inner) : inner_{inner} {}

  outcome::result<void> WriteTrack::accept(BytesIn bytes) {
    OUTCOME_TRY(inner_.accept(bytes));
    position_ += bytes.size();
    return outcome::success();
  }

  size_t WriteTrack::position() const {
    return position_;
  }
}  // namespace bw::codec::binwrite
