/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(bw::common, UnhexError, e) {
  using bw::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
    default:
      return "Unknown error";
  }
}

namespace bw::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &) {
      return outcome::failure(UnhexError::kNotEnoughInput);
    } catch (const boost::algorithm::non_hex_input &) {
      return outcome::failure(UnhexError::kNonHexInput);
    }
  }
}  // namespace bw::common
