/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/binwrite/binwrite_impls.hpp"
#include "codec/binwrite/streams_annotation.hpp"
#include "codec/binwrite/value.hpp"
#include "codec/binwrite/writers.hpp"

namespace bw::codec::binwrite {
  namespace detail {
    void logEncodeFailure(const std::error_code &error);
  }  // namespace detail

  /**
   * @brief Encodes value into sink
   * @tparam T - type to be encoded
   * @param value - data to be encoded
   * @param sink - destination, holds bytes written before failure if any
   * @param options - root context
   * @return first failure or success
   */
  template <typename T>
  outcome::result<void> encode(const T &value,
                               Sink &sink,
                               const WriterOption &options) {
    auto result{writeOptions(value, sink, options)};
    if (!result) {
      detail::logEncodeFailure(result.error());
    }
    return result;
  }

  template <typename T>
  outcome::result<void> encode(const T &value,
                               Sink &sink,
                               Endian default_endian) {
    WriterOption options;
    options.endian = default_endian;
    return encode(value, sink, options);
  }

  template <typename T>
  outcome::result<void> encode(const T &value, Sink &sink) {
    return encode(value, sink, WriterOption{});
  }

  /**
   * @brief Encodes value to byte-vector
   * @return encoded data
   */
  template <typename T>
  outcome::result<Bytes> encodeToBytes(const T &value,
                                       Endian default_endian = Endian::kNative) {
    Bytes bytes;
    BytesSink sink{bytes};
    OUTCOME_TRY(encode(value, sink, default_endian));
    return bytes;
  }
}  // namespace bw::codec::binwrite
