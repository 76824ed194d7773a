/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include "cli/validate/with.hpp"
#include "codec/binwrite/value.hpp"

namespace bw::codec::binwrite {
  /**
   * Parses decimal `str` as Wide and narrows it to T
   * @return none if not a number or out of T range
   */
  template <typename T, typename Wide>
  boost::optional<Value> parseAs(const std::string &str) {
    if (std::is_unsigned_v<Wide> && !str.empty() && str.front() == '-') {
      // lexical_cast wraps negative input of unsigned types
      return boost::none;
    }
    try {
      return Value{boost::numeric_cast<T>(boost::lexical_cast<Wide>(str))};
    } catch (const boost::bad_lexical_cast &) {
      return boost::none;
    } catch (const boost::bad_numeric_cast &) {
      return boost::none;
    }
  }

  /** Parses command line value as primitive of given type */
  inline boost::optional<Value> parsePrimitive(PrimitiveType type,
                                               const std::string &str) {
    switch (type) {
      case PrimitiveType::kU8:
        return parseAs<uint8_t, uint64_t>(str);
      case PrimitiveType::kI8:
        return parseAs<int8_t, int64_t>(str);
      case PrimitiveType::kU16:
        return parseAs<uint16_t, uint64_t>(str);
      case PrimitiveType::kI16:
        return parseAs<int16_t, int64_t>(str);
      case PrimitiveType::kU32:
        return parseAs<uint32_t, uint64_t>(str);
      case PrimitiveType::kI32:
        return parseAs<int32_t, int64_t>(str);
      case PrimitiveType::kU64:
        return parseAs<uint64_t, uint64_t>(str);
      case PrimitiveType::kI64:
        return parseAs<int64_t, int64_t>(str);
      case PrimitiveType::kF32:
        return parseAs<float, double>(str);
      case PrimitiveType::kF64:
        return parseAs<double, double>(str);
    }
    return boost::none;
  }

  CLI_VALIDATE(Endian) {
    validateWith(out, values, [](const std::string &value) {
      return common::from_string<Endian>(value);
    });
  }

  CLI_VALIDATE(PrimitiveType) {
    validateWith(out, values, [](const std::string &value) {
      return common::from_string<PrimitiveType>(value);
    });
  }
}  // namespace bw::codec::binwrite
