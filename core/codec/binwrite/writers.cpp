/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/writers.hpp"

#include <iterator>

#include <utf8.h>

namespace bw::codec::binwrite {
  outcome::result<void> writeCodePoint(char32_t code_point, Sink &sink) {
    Bytes bytes;
    try {
      utf8::append(static_cast<uint32_t>(code_point),
                   std::back_inserter(bytes));
    } catch (const utf8::invalid_code_point &) {
      return outcome::failure(BinwriteError::kInvalidCodePoint);
    }
    return sink.accept(bytes);
  }

  outcome::result<void> writeNullTerminated(std::string_view str,
                                            Sink &sink,
                                            const WriterOption &options) {
    OUTCOME_TRY(writeOptions(str, sink, options));
    return writeOptions(uint8_t{0}, sink, options);
  }

  outcome::result<void> writeUtf16(std::string_view str,
                                   Sink &sink,
                                   const WriterOption &options) {
    if (!utf8::is_valid(str.begin(), str.end())) {
      return outcome::failure(BinwriteError::kInvalidUtf8);
    }
    std::vector<uint16_t> units;
    utf8::utf8to16(str.begin(), str.end(), std::back_inserter(units));
    return writeOptions(units, sink, options);
  }

  outcome::result<void> writeUtf16Null(std::string_view str,
                                       Sink &sink,
                                       const WriterOption &options) {
    OUTCOME_TRY(writeUtf16(str, sink, options));
    return writeOptions(uint16_t{0}, sink, options);
  }
}  // namespace bw::codec::binwrite
