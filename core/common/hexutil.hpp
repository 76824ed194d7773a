/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace bw::common {
  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { kNonHexInput = 1, kNotEnoughInput };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes bytes to encode
   * @return hexencoded string
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string of either case, even length
   * @return decoded bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace bw::common

OUTCOME_HPP_DECLARE_ERROR(bw::common, UnhexError);
