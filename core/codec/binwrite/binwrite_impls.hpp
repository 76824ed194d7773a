/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstring>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian/buffers.hpp>

#include "codec/binwrite/sink.hpp"
#include "codec/binwrite/writer_option.hpp"

namespace bw::codec::binwrite {
  /**
   * Encoder of values of type T. Types without specialization below are
   * encoded by `binwriteEncode(const T &, Sink &, const WriterOption &)`
   * found by ADL, see BINWRITE_ENCODE.
   */
  template <typename T, typename = void>
  struct BinWrite {
    static outcome::result<void> write(const T &value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return binwriteEncode(value, sink, options);
    }
  };

  /** Writes value with given options */
  template <typename T>
  outcome::result<void> writeOptions(const T &value,
                                     Sink &sink,
                                     const WriterOption &options) {
    return BinWrite<T>::write(value, sink, options);
  }

  /** Writes value with native byte order */
  template <typename T>
  outcome::result<void> write(const T &value, Sink &sink) {
    return writeOptions(value, sink, WriterOption{});
  }

  inline outcome::result<void> writeFields(Sink &, const WriterOption &) {
    return outcome::success();
  }

  /** Writes fields in order, stops at first failure */
  template <typename T, typename... Ts>
  outcome::result<void> writeFields(Sink &sink,
                                    const WriterOption &options,
                                    const T &field,
                                    const Ts &...fields) {
    OUTCOME_TRY(writeOptions(field, sink, options));
    return writeFields(sink, options, fields...);
  }

  /** Writes elements of range in order, without count */
  template <typename It>
  outcome::result<void> writeEach(It begin,
                                  It end,
                                  Sink &sink,
                                  const WriterOption &options) {
    for (; begin != end; ++begin) {
      OUTCOME_TRY(writeOptions(*begin, sink, options));
    }
    return outcome::success();
  }

  /**
   * Checks that element count fits into length field type
   * @return count converted to LenT or kUnrepresentableLength
   */
  template <typename LenT>
  outcome::result<LenT> checkLength(size_t count) {
    static_assert(std::is_integral_v<LenT>);
    if (count > static_cast<std::make_unsigned_t<LenT>>(
            std::numeric_limits<LenT>::max())) {
      return outcome::failure(BinwriteError::kUnrepresentableLength);
    }
    return static_cast<LenT>(count);
  }

  namespace detail {
    template <size_t size>
    struct UintOfSize;
    template <>
    struct UintOfSize<1> {
      using type = uint8_t;
    };
    template <>
    struct UintOfSize<2> {
      using type = uint16_t;
    };
    template <>
    struct UintOfSize<4> {
      using type = uint32_t;
    };
    template <>
    struct UintOfSize<8> {
      using type = uint64_t;
    };

    template <typename T>
    using UintOf = typename UintOfSize<sizeof(T)>::type;

    template <boost::endian::order kOrder, typename U>
    outcome::result<void> writeOrdered(U bits, Sink &sink) {
      boost::endian::endian_buffer<kOrder, U, sizeof(U) * 8> buffer{};
      buffer = bits;  // cannot initialize, only assign
      return sink.accept(BytesIn(
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<const uint8_t *>(buffer.data()),
          sizeof(U)));
    }

    /** Writes unsigned bits in single accept call */
    template <typename U>
    outcome::result<void> writeBits(U bits, Sink &sink, Endian endian) {
      static_assert(std::is_unsigned_v<U>);
      using boost::endian::order;
      if (endian == Endian::kNative) {
        endian = nativeEndian();
      }
      if (endian == Endian::kBig) {
        return writeOrdered<order::big>(bits, sink);
      }
      return writeOrdered<order::little>(bits, sink);
    }

    template <typename T>
    constexpr bool kIsPlainInteger = std::is_integral_v<T>
                                     && !std::is_same_v<T, bool>
                                     && !std::is_same_v<T, char32_t>;
  }  // namespace detail

  /// Integers, two's complement of sizeof(T) bytes
  template <typename T>
  struct BinWrite<T, std::enable_if_t<detail::kIsPlainInteger<T>>> {
    static outcome::result<void> write(T value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return detail::writeBits(
          static_cast<detail::UintOf<T>>(value), sink, options.endian);
    }
  };

  /// IEEE-754 floats
  template <typename T>
  struct BinWrite<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static_assert(std::numeric_limits<T>::is_iec559,
                  "only IEEE-754 floats are supported");

    static outcome::result<void> write(T value,
                                       Sink &sink,
                                       const WriterOption &options) {
      detail::UintOf<T> bits{};
      static_assert(sizeof(bits) == sizeof(value));
      std::memcpy(&bits, &value, sizeof(bits));
      return detail::writeBits(bits, sink, options.endian);
    }
  };

  /// Enums as underlying integer
  template <typename T>
  struct BinWrite<T, std::enable_if_t<std::is_enum_v<T>>> {
    static outcome::result<void> write(T value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeOptions(common::to_int(value), sink, options);
    }
  };

  /// Bool as single 0 or 1 byte
  template <>
  struct BinWrite<bool> {
    static outcome::result<void> write(bool value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeOptions(static_cast<uint8_t>(value ? 1 : 0), sink, options);
    }
  };

  /** Writes UTF-8 encoding of code point */
  outcome::result<void> writeCodePoint(char32_t code_point, Sink &sink);

  /// Unicode character as UTF-8, byte order does not apply
  template <>
  struct BinWrite<char32_t> {
    static outcome::result<void> write(char32_t value,
                                       Sink &sink,
                                       const WriterOption &) {
      return writeCodePoint(value, sink);
    }
  };

  /// Raw bytes in single accept call
  template <>
  struct BinWrite<BytesIn> {
    static outcome::result<void> write(BytesIn value,
                                       Sink &sink,
                                       const WriterOption &) {
      return sink.accept(value);
    }
  };

  /// String bytes as is, without terminator
  template <>
  struct BinWrite<std::string_view> {
    static outcome::result<void> write(std::string_view value,
                                       Sink &sink,
                                       const WriterOption &) {
      return sink.accept(BytesIn(
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<const uint8_t *>(value.data()),
          value.size()));
    }
  };

  template <>
  struct BinWrite<std::string> {
    static outcome::result<void> write(const std::string &value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeOptions(std::string_view{value}, sink, options);
    }
  };

  /// Fixed size array, elements only
  template <typename T, size_t N>
  struct BinWrite<std::array<T, N>> {
    static outcome::result<void> write(const std::array<T, N> &values,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeEach(values.begin(), values.end(), sink, options);
    }
  };

  template <typename T, size_t N>
  struct BinWrite<T[N]> {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays)
    static outcome::result<void> write(const T (&values)[N],
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeEach(std::begin(values), std::end(values), sink, options);
    }
  };

  /// Variable size collection, elements only, no count
  template <typename T>
  struct BinWrite<std::vector<T>> {
    static outcome::result<void> write(const std::vector<T> &values,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeEach(values.begin(), values.end(), sink, options);
    }
  };

  template <typename T>
  struct BinWrite<gsl::span<T>,
                  std::enable_if_t<!std::is_same_v<gsl::span<T>, BytesIn>>> {
    static outcome::result<void> write(const gsl::span<T> &values,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeEach(values.begin(), values.end(), sink, options);
    }
  };

  /// Tuple fields in order
  template <typename... Ts>
  struct BinWrite<std::tuple<Ts...>> {
    static outcome::result<void> write(const std::tuple<Ts...> &values,
                                       Sink &sink,
                                       const WriterOption &options) {
      return std::apply(
          [&](const auto &...fields) {
            return writeFields(sink, options, fields...);
          },
          values);
    }
  };

  template <typename T1, typename T2>
  struct BinWrite<std::pair<T1, T2>> {
    static outcome::result<void> write(const std::pair<T1, T2> &values,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeFields(sink, options, values.first, values.second);
    }
  };

  /**
   * Value with its own byte order declaration. T is a reference for lvalue
   * arguments, rvalue arguments are stored.
   */
  template <typename T>
  struct Endianed {
    T value;
    EndianOverride endian;
  };

  /**
   * Declares byte order of field and all its descendants without own
   * declaration
   */
  template <typename T>
  Endianed<T> withEndian(Endian endian, T &&value) {
    return Endianed<T>{std::forward<T>(value), endian};
  }

  template <typename T>
  Endianed<T> withEndian(FieldEndian endian, T &&value) {
    return Endianed<T>{std::forward<T>(value), toOverride(endian)};
  }

  template <typename T>
  struct BinWrite<Endianed<T>> {
    static outcome::result<void> write(const Endianed<T> &field,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeOptions(field.value, sink, resolve(options, field.endian));
    }
  };

  /**
   * Collection preceded by its element count of type LenT. C is a reference
   * for lvalue arguments, rvalue arguments are stored.
   */
  template <typename LenT, typename C>
  struct LengthPrefixed {
    C items;
  };

  template <typename LenT, typename C>
  LengthPrefixed<LenT, C> lengthPrefixed(C &&items) {
    return LengthPrefixed<LenT, C>{std::forward<C>(items)};
  }

  template <typename LenT, typename C>
  struct BinWrite<LengthPrefixed<LenT, C>> {
    static outcome::result<void> write(const LengthPrefixed<LenT, C> &field,
                                       Sink &sink,
                                       const WriterOption &options) {
      OUTCOME_TRY(count, checkLength<LenT>(std::size(field.items)));
      OUTCOME_TRY(writeOptions(count, sink, options));
      return writeOptions(field.items, sink, options);
    }
  };
}  // namespace bw::codec::binwrite
