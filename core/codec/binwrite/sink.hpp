/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include "codec/binwrite/binwrite_errors.hpp"
#include "common/bytes.hpp"

namespace bw::codec::binwrite {
  /**
   * Append-only byte destination. Implementations must keep write order and
   * must not buffer and reorder bytes across calls.
   */
  class Sink {
   public:
    virtual ~Sink() = default;

    /**
     * Append bytes
     * @param bytes - bytes to write, all of them or none on failure
     */
    virtual outcome::result<void> accept(BytesIn bytes) = 0;
  };

  /** Appends to byte vector, owned or borrowed */
  class BytesSink : public Sink {
   public:
    BytesSink();
    explicit BytesSink(Bytes &out);
    BytesSink(const BytesSink &) = delete;
    BytesSink &operator=(const BytesSink &) = delete;

    outcome::result<void> accept(BytesIn bytes) override;

    const Bytes &data() const;

   private:
    Bytes own_;
    Bytes *out_;
  };

  /** Writes to std::ostream, fails when stream turns bad */
  class OstreamSink : public Sink {
   public:
    explicit OstreamSink(std::ostream &os);

    outcome::result<void> accept(BytesIn bytes) override;

   private:
    std::ostream &os_;
  };

  /**
   * Forwards to inner sink until capacity is reached. Write exceeding
   * capacity is rejected as a whole.
   */
  class BoundedSink : public Sink {
   public:
    BoundedSink(Sink &inner, size_t capacity);

    outcome::result<void> accept(BytesIn bytes) override;

    size_t remaining() const;

   private:
    Sink &inner_;
    size_t capacity_;
    size_t written_{0};
  };

  /**
   * Wraps another sink, tracking number of bytes written through it since
   * creation
   */
  class WriteTrack : public Sink {
   public:
    explicit WriteTrack(Sink &inner);

    outcome::result<void> accept(BytesIn bytes) override;

    size_t position() const;

   private:
    Sink &inner_;
    size_t position_{0};
  };
}  // namespace bw::codec::binwrite
