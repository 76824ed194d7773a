/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "codec/binwrite/binwrite_impls.hpp"

namespace bw::codec::binwrite {
  enum class PrimitiveType {
    kU8,
    kI8,
    kU16,
    kI16,
    kU32,
    kI32,
    kU64,
    kI64,
    kF32,
    kF64,
  };

  inline const auto &class_conversion_table(PrimitiveType) {
    static constexpr common::ConversionTable<PrimitiveType, 10> table{{
        {PrimitiveType::kU8, "u8"},
        {PrimitiveType::kI8, "i8"},
        {PrimitiveType::kU16, "u16"},
        {PrimitiveType::kI16, "i16"},
        {PrimitiveType::kU32, "u32"},
        {PrimitiveType::kI32, "i32"},
        {PrimitiveType::kU64, "u64"},
        {PrimitiveType::kI64, "i64"},
        {PrimitiveType::kF32, "f32"},
        {PrimitiveType::kF64, "f64"},
    }};
    return table;
  }

  /// Alternatives are in PrimitiveType order
  using Primitive = boost::variant<uint8_t,
                                   int8_t,
                                   uint16_t,
                                   int16_t,
                                   uint32_t,
                                   int32_t,
                                   uint64_t,
                                   int64_t,
                                   float,
                                   double>;

  template <typename T>
  constexpr bool kIsPrimitive = std::is_same_v<T, uint8_t>
                                || std::is_same_v<T, int8_t>
                                || std::is_same_v<T, uint16_t>
                                || std::is_same_v<T, int16_t>
                                || std::is_same_v<T, uint32_t>
                                || std::is_same_v<T, int32_t>
                                || std::is_same_v<T, uint64_t>
                                || std::is_same_v<T, int64_t>
                                || std::is_same_v<T, float>
                                || std::is_same_v<T, double>;

  class Value;
  struct Field;

  /// Ordered named fields of independent types
  struct Composite {
    std::vector<Field> fields;
  };

  /// Exactly `size` elements of same type
  struct FixedSequence {
    size_t size{};
    std::vector<Value> elements;
  };

  /// Elements of same type, count known at encode time only
  struct VariableSequence {
    std::vector<Value> elements;
  };

  /**
   * Runtime description of data to encode, built right before encoding.
   * Sequences are only constructible through factories checking their
   * elements.
   */
  class Value {
   public:
    enum class Kind { kPrimitive, kComposite, kFixed, kVariable };

    using Storage =
        boost::variant<Primitive, Composite, FixedSequence, VariableSequence>;

    template <typename T, typename = std::enable_if_t<kIsPrimitive<T>>>
    // NOLINTNEXTLINE(google-explicit-constructor)
    Value(T primitive) : storage_{Primitive{primitive}} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    Value(Composite composite);

    /**
     * Fixed length sequence
     * @param size - declared length
     * @param elements - must contain exactly `size` elements of same type
     * @return kFixedSizeMismatch or kHeterogeneousSequence on violation
     */
    static outcome::result<Value> makeFixed(size_t size,
                                            std::vector<Value> elements);

    /**
     * Variable length sequence, elements must be of same type
     */
    static outcome::result<Value> makeSequence(std::vector<Value> elements);

    /**
     * Primitive of runtime type from integer
     * @return kUnrepresentableLength if value does not fit type
     */
    static outcome::result<Value> makeUnsigned(PrimitiveType type,
                                               uint64_t value);

    /** Unnamed fields with inherited byte order */
    static Value tuple(std::vector<Value> items);

    Kind kind() const;

    const Storage &storage() const;

   private:
    explicit Value(Storage storage);

    Storage storage_;
  };

  struct Field {
    std::string name;
    Value value;
    EndianOverride endian;
  };

  /**
   * Structural type compatibility. Element counts of variable sequences are
   * not part of the type, elements of empty sequences match any type.
   */
  bool sameType(const Value &lhs, const Value &rhs);

  PrimitiveType primitiveType(const Primitive &primitive);

  /**
   * Registers composite fields in declaration order. First failed
   * registration is reported by build().
   */
  class CompositeBuilder {
   public:
    CompositeBuilder &field(std::string name,
                            Value value,
                            FieldEndian endian = FieldEndian::kInherit);

    /**
     * Registers explicit count field of `count_type` named `name + "_len"`
     * followed by sequence field `name`. Both share byte order `endian`.
     * @param sequence - variable or fixed sequence
     */
    CompositeBuilder &lengthPrefixed(std::string name,
                                     PrimitiveType count_type,
                                     Value sequence,
                                     FieldEndian endian = FieldEndian::kInherit);

    outcome::result<Value> build();

   private:
    Composite composite_;
    boost::optional<std::error_code> error_;
  };

  /** Writes value with options, dispatching on value kind */
  outcome::result<void> writeValue(const Value &value,
                                   Sink &sink,
                                   const WriterOption &options);

  template <>
  struct BinWrite<Value> {
    static outcome::result<void> write(const Value &value,
                                       Sink &sink,
                                       const WriterOption &options) {
      return writeValue(value, sink, options);
    }
  };
}  // namespace bw::codec::binwrite
