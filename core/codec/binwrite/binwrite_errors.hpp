/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace bw::codec::binwrite {
  enum class BinwriteError {
    kSinkIoFailure = 1,
    kSinkCapacityExceeded,
    kUnrepresentableLength,
    kFixedSizeMismatch,
    kHeterogeneousSequence,
    kNotSequence,
    kInvalidUtf8,
    kInvalidCodePoint,
  };
}  // namespace bw::codec::binwrite

OUTCOME_HPP_DECLARE_ERROR(bw::codec::binwrite, BinwriteError);
