/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

/**
 * EXPECT_OUTCOME_TRUE_1(expr) checks that expr succeeded.
 * EXPECT_OUTCOME_TRUE(var, expr) also binds success value to var.
 */
#define EXPECT_OUTCOME_TRUE_1(expr)                      \
  {                                                      \
    auto &&_result = (expr);                             \
    ASSERT_TRUE(_result) << _result.error().message();   \
  }

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE_NAME(var) _outcome_##var
#define EXPECT_OUTCOME_TRUE(var, expr)                          \
  auto &&_EXPECT_OUTCOME_TRUE_NAME(var) = (expr);               \
  ASSERT_TRUE(_EXPECT_OUTCOME_TRUE_NAME(var))                   \
      << _EXPECT_OUTCOME_TRUE_NAME(var).error().message();      \
  auto &&var = _EXPECT_OUTCOME_TRUE_NAME(var).value();

#define EXPECT_OUTCOME_EQ(expr, expected)                \
  {                                                      \
    auto &&_result = (expr);                             \
    ASSERT_TRUE(_result) << _result.error().message();   \
    EXPECT_EQ(_result.value(), (expected));              \
  }

#define EXPECT_OUTCOME_ERROR(error, expr)                \
  {                                                      \
    auto &&_result = (expr);                             \
    ASSERT_FALSE(_result);                               \
    EXPECT_EQ(_result.error(), make_error_code(error));  \
  }
