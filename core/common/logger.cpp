/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace bw::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%l%$ %v"};
  }  // namespace

  Logger createLogger(const std::string &tag) {
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      try {
        logger = spdlog::stdout_color_mt(tag);
        logger->set_pattern(kPattern);
      } catch (const spdlog::spdlog_ex &) {
        // registered concurrently by another thread
        logger = spdlog::get(tag);
      }
    }
    return logger;
  }

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return spdlog::level::info;
    }
  }
}  // namespace bw::common
