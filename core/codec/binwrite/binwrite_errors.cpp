/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/binwrite_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bw::codec::binwrite, BinwriteError, e) {
  using bw::codec::binwrite::BinwriteError;
  switch (e) {
    case BinwriteError::kSinkIoFailure:
      return "Sink output stream failure";
    case BinwriteError::kSinkCapacityExceeded:
      return "Sink capacity exceeded";
    case BinwriteError::kUnrepresentableLength:
      return "Element count does not fit length field";
    case BinwriteError::kFixedSizeMismatch:
      return "Element count differs from fixed sequence size";
    case BinwriteError::kHeterogeneousSequence:
      return "Sequence elements have different types";
    case BinwriteError::kNotSequence:
      return "Value is not a sequence";
    case BinwriteError::kInvalidUtf8:
      return "Invalid UTF-8 string";
    case BinwriteError::kInvalidCodePoint:
      return "Invalid code point";
    default:
      return "Unknown error";
  }
}
