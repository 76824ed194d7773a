/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/binwrite.hpp"

#include "common/logger.hpp"

namespace bw::codec::binwrite::detail {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("binwrite");
      return logger.get();
    }
  }  // namespace

  void logEncodeFailure(const std::error_code &error) {
    log()->debug("encode failed: {}", error.message());
  }
}  // namespace bw::codec::binwrite::detail
