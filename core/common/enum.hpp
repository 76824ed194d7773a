/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/optional.hpp>
#include <string_view>
#include <type_traits>

namespace bw::common {
  template <typename Enumeration, size_t Number>
  using ConversionTable =
      std::array<std::pair<Enumeration, std::string_view>, Number>;

  /**
   * Table is found by ADL: `class_conversion_table(Enumeration)` must be
   * declared in the enumeration namespace
   */
  template <typename T>
  const auto &conversion_table() {
    return class_conversion_table(T{});
  }

  /**
   * @brief Convert enum class value as integer
   * Usage:
   *   @code
   *   enum class Enumerator { one = 1, eleven = 11 };
   *   int v = to_int(Enumerator::eleven); // v == 11
   *   @nocode
   *
   * @tparam Enumeration - enum type
   * @param value - to convert
   * @return integer value of enum
   */
  template <typename Enumeration>
  constexpr auto to_int(Enumeration const value) ->
      typename std::underlying_type<Enumeration>::type {
    return static_cast<typename std::underlying_type<Enumeration>::type>(
        value);
  }

  /**
   * @brief Convert enum class value to its name from conversion table
   * @return name or none if value is absent in table
   */
  template <typename Enumeration>
  boost::optional<std::string_view> to_string(Enumeration const value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (enumerator == value) {
        return str;
      }
    }
    return boost::none;
  }

  /**
   * @brief Convert name from conversion table to enum value
   * @return enum value or none if name is unknown
   */
  template <typename Enumeration>
  boost::optional<Enumeration> from_string(const std::string_view value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (str == value) {
        return enumerator;
      }
    }
    return boost::none;
  }
}  // namespace bw::common
