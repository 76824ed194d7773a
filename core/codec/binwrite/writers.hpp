/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/binwrite/binwrite_impls.hpp"

namespace bw::codec::binwrite {
  /// UTF-8 string followed by zero byte
  struct CString {
    std::string_view value;
  };

  /// UTF-8 string transcoded to UTF-16 code units
  struct Utf16String {
    std::string_view value;
  };

  /// UTF-16 string followed by zero code unit
  struct Utf16NullString {
    std::string_view value;
  };

  outcome::result<void> writeNullTerminated(std::string_view str,
                                            Sink &sink,
                                            const WriterOption &options);

  /**
   * Writes every UTF-16 code unit of string with options byte order
   * @param str - UTF-8 string, validated before any write
   */
  outcome::result<void> writeUtf16(std::string_view str,
                                   Sink &sink,
                                   const WriterOption &options);

  outcome::result<void> writeUtf16Null(std::string_view str,
                                       Sink &sink,
                                       const WriterOption &options);

  template <>
  struct BinWrite<CString> {
    static outcome::result<void> write(const CString &str,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeNullTerminated(str.value, sink, options);
    }
  };

  template <>
  struct BinWrite<Utf16String> {
    static outcome::result<void> write(const Utf16String &str,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeUtf16(str.value, sink, options);
    }
  };

  template <>
  struct BinWrite<Utf16NullString> {
    static outcome::result<void> write(const Utf16NullString &str,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeUtf16Null(str.value, sink, options);
    }
  };
}  // namespace bw::codec::binwrite
