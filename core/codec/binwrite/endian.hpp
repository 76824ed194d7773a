/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian/conversion.hpp>
#include <boost/optional.hpp>

#include "common/enum.hpp"

namespace bw::codec::binwrite {
  /** Byte order of multi-byte primitives */
  enum class Endian { kBig, kLittle, kNative };

  /** Per-field byte order declaration, kInherit keeps enclosing order */
  enum class FieldEndian { kInherit, kBig, kLittle, kNative };

  using EndianOverride = boost::optional<Endian>;

  /** Byte order of the host */
  constexpr Endian nativeEndian() {
    return boost::endian::order::native == boost::endian::order::little
               ? Endian::kLittle
               : Endian::kBig;
  }

  /**
   * Effective byte order of a field
   * @param inherited - byte order of enclosing scope
   * @param override - byte order declared on the field, if any
   * @return override if present, inherited otherwise
   */
  inline Endian resolve(Endian inherited, const EndianOverride &override) {
    return override ? *override : inherited;
  }

  inline EndianOverride toOverride(FieldEndian endian) {
    switch (endian) {
      case FieldEndian::kBig:
        return Endian::kBig;
      case FieldEndian::kLittle:
        return Endian::kLittle;
      case FieldEndian::kNative:
        return Endian::kNative;
      case FieldEndian::kInherit:
        break;
    }
    return boost::none;
  }

  inline const auto &class_conversion_table(Endian) {
    static constexpr common::ConversionTable<Endian, 3> table{{
        {Endian::kBig, "big"},
        {Endian::kLittle, "little"},
        {Endian::kNative, "native"},
    }};
    return table;
  }
}  // namespace bw::codec::binwrite
