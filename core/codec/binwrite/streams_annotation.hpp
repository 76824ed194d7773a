/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Declares encoder of user type, found by ADL, so it must be placed in the
 * namespace of the type. Body has `sink` and `options` in scope.
 * @code
 * BINWRITE_ENCODE(Header, v) {
 *   return writeFields(sink, options, v.magic, withEndian(Endian::kBig, v.len));
 * }
 * @nocode
 */
#define BINWRITE_ENCODE(type, var)                                \
  inline ::bw::outcome::result<void> binwriteEncode(              \
      const type &var, /* NOLINT(bugprone-macro-parentheses) */   \
      ::bw::codec::binwrite::Sink &sink,                          \
      const ::bw::codec::binwrite::WriterOption &options)

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_1(m) t.m
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_2(m, ...) t.m, _BINWRITE_TUPLE_1(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_3(m, ...) t.m, _BINWRITE_TUPLE_2(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_4(m, ...) t.m, _BINWRITE_TUPLE_3(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_5(m, ...) t.m, _BINWRITE_TUPLE_4(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_6(m, ...) t.m, _BINWRITE_TUPLE_5(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_7(m, ...) t.m, _BINWRITE_TUPLE_6(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_8(m, ...) t.m, _BINWRITE_TUPLE_7(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_9(m, ...) t.m, _BINWRITE_TUPLE_8(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_10(m, ...) t.m, _BINWRITE_TUPLE_9(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_11(m, ...) t.m, _BINWRITE_TUPLE_10(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_12(m, ...) t.m, _BINWRITE_TUPLE_11(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_13(m, ...) t.m, _BINWRITE_TUPLE_12(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_14(m, ...) t.m, _BINWRITE_TUPLE_13(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_15(m, ...) t.m, _BINWRITE_TUPLE_14(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_16(m, ...) t.m, _BINWRITE_TUPLE_15(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_17(m, ...) t.m, _BINWRITE_TUPLE_16(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_18(m, ...) t.m, _BINWRITE_TUPLE_17(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_19(m, ...) t.m, _BINWRITE_TUPLE_18(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_20(m, ...) t.m, _BINWRITE_TUPLE_19(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE_V(_1,  \
                          _2,  \
                          _3,  \
                          _4,  \
                          _5,  \
                          _6,  \
                          _7,  \
                          _8,  \
                          _9,  \
                          _10, \
                          _11, \
                          _12, \
                          _13, \
                          _14, \
                          _15, \
                          _16, \
                          _17, \
                          _18, \
                          _19, \
                          _20, \
                          f,   \
                          ...) \
  f
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _BINWRITE_TUPLE(...)            \
  _BINWRITE_TUPLE_V(__VA_ARGS__,        \
                    _BINWRITE_TUPLE_20, \
                    _BINWRITE_TUPLE_19, \
                    _BINWRITE_TUPLE_18, \
                    _BINWRITE_TUPLE_17, \
                    _BINWRITE_TUPLE_16, \
                    _BINWRITE_TUPLE_15, \
                    _BINWRITE_TUPLE_14, \
                    _BINWRITE_TUPLE_13, \
                    _BINWRITE_TUPLE_12, \
                    _BINWRITE_TUPLE_11, \
                    _BINWRITE_TUPLE_10, \
                    _BINWRITE_TUPLE_9,  \
                    _BINWRITE_TUPLE_8,  \
                    _BINWRITE_TUPLE_7,  \
                    _BINWRITE_TUPLE_6,  \
                    _BINWRITE_TUPLE_5,  \
                    _BINWRITE_TUPLE_4,  \
                    _BINWRITE_TUPLE_3,  \
                    _BINWRITE_TUPLE_2,  \
                    _BINWRITE_TUPLE_1)  \
  (__VA_ARGS__)

/**
 * Encodes listed members in order, each with byte order of the enclosing
 * scope
 */
#define BINWRITE_TUPLE(T, ...)                        \
  BINWRITE_ENCODE(T, t) {                             \
    return ::bw::codec::binwrite::writeFields(        \
        sink, options, _BINWRITE_TUPLE(__VA_ARGS__)); \
  }

/** Encodes nothing */
#define BINWRITE_TUPLE_0(T)                                  \
  BINWRITE_ENCODE(T, t) {                                    \
    return ::bw::codec::binwrite::writeFields(sink, options); \
  }
