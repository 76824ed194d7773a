/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BINWRITE_INCLUDE_BINWRITE_HPP
#define BINWRITE_INCLUDE_BINWRITE_HPP

#include "codec/binwrite/binwrite.hpp"

namespace bw {
  using codec::binwrite::BinwriteError;
  using codec::binwrite::BytesSink;
  using codec::binwrite::CompositeBuilder;
  using codec::binwrite::encode;
  using codec::binwrite::encodeToBytes;
  using codec::binwrite::Endian;
  using codec::binwrite::FieldEndian;
  using codec::binwrite::Sink;
  using codec::binwrite::Value;
  using codec::binwrite::WriterOption;
}  // namespace bw

#endif  // BINWRITE_INCLUDE_BINWRITE_HPP
