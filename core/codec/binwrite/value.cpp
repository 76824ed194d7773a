/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/binwrite/value.hpp"

#include "common/logger.hpp"

namespace bw::codec::binwrite {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("binwrite_value");
      return logger.get();
    }

    template <typename T>
    outcome::result<Value> makeInteger(uint64_t value) {
      OUTCOME_TRY(narrow, checkLength<T>(value));
      return Value{narrow};
    }

    /**
     * Structural type of a value. Element shape of an empty sequence is
     * unknown and matches any shape.
     */
    struct Shape {
      Value::Kind kind{};
      int primitive{};
      size_t size{};
      std::vector<const Field *> fields;
      /// field shapes, or at most one element shape of sequence
      std::vector<Shape> children;
    };

    /// Merges `other` into `into`, false if they differ
    bool unify(Shape &into, const Shape &other) {
      if (into.kind != other.kind) {
        return false;
      }
      switch (into.kind) {
        case Value::Kind::kPrimitive:
          return into.primitive == other.primitive;
        case Value::Kind::kComposite:
          if (into.fields.size() != other.fields.size()) {
            return false;
          }
          for (size_t i = 0; i < into.fields.size(); ++i) {
            if (into.fields[i]->name != other.fields[i]->name
                || into.fields[i]->endian != other.fields[i]->endian
                || !unify(into.children[i], other.children[i])) {
              return false;
            }
          }
          return true;
        case Value::Kind::kFixed:
          if (into.size != other.size) {
            return false;
          }
          break;
        case Value::Kind::kVariable:
          break;
      }
      if (other.children.empty()) {
        return true;
      }
      if (into.children.empty()) {
        into.children = other.children;
        return true;
      }
      return unify(into.children.front(), other.children.front());
    }

    outcome::result<Shape> shapeOf(const Value &value);

    /// Shape all elements agree on, none if there are no elements
    outcome::result<boost::optional<Shape>> elementShape(
        const std::vector<Value> &elements) {
      boost::optional<Shape> merged;
      for (const auto &element : elements) {
        OUTCOME_TRY(shape, shapeOf(element));
        if (!merged) {
          merged = std::move(shape);
        } else if (!unify(*merged, shape)) {
          log()->debug("sequence element types differ");
          return outcome::failure(BinwriteError::kHeterogeneousSequence);
        }
      }
      return merged;
    }

    outcome::result<Shape> shapeOf(const Value &value) {
      Shape shape;
      shape.kind = value.kind();
      const std::vector<Value> *elements{nullptr};
      switch (value.kind()) {
        case Value::Kind::kPrimitive:
          shape.primitive = boost::get<Primitive>(value.storage()).which();
          return shape;
        case Value::Kind::kComposite:
          for (const auto &field :
               boost::get<Composite>(value.storage()).fields) {
            OUTCOME_TRY(child, shapeOf(field.value));
            shape.fields.push_back(&field);
            shape.children.push_back(std::move(child));
          }
          return shape;
        case Value::Kind::kFixed: {
          const auto &fixed{boost::get<FixedSequence>(value.storage())};
          shape.size = fixed.size;
          elements = &fixed.elements;
          break;
        }
        case Value::Kind::kVariable:
          elements = &boost::get<VariableSequence>(value.storage()).elements;
          break;
      }
      OUTCOME_TRY(element, elementShape(*elements));
      if (element) {
        shape.children.push_back(std::move(*element));
      }
      return shape;
    }

    outcome::result<void> checkHomogeneous(const std::vector<Value> &elements) {
      OUTCOME_TRY(elementShape(elements));
      return outcome::success();
    }

    outcome::result<size_t> sequenceSize(const Value &value) {
      switch (value.kind()) {
        case Value::Kind::kFixed:
          return boost::get<FixedSequence>(value.storage()).size;
        case Value::Kind::kVariable:
          return boost::get<VariableSequence>(value.storage()).elements.size();
        default:
          return outcome::failure(BinwriteError::kNotSequence);
      }
    }
  }  // namespace

  Value::Value(Composite composite) : storage_{std::move(composite)} {}

  Value::Value(Storage storage) : storage_{std::move(storage)} {}

  outcome::result<Value> Value::makeFixed(size_t size,
                                          std::vector<Value> elements) {
    if (elements.size() != size) {
      log()->debug("fixed sequence of size {} got {} elements",
                   size,
                   elements.size());
      return outcome::failure(BinwriteError::kFixedSizeMismatch);
    }
    OUTCOME_TRY(checkHomogeneous(elements));
    return Value{Storage{FixedSequence{size, std::move(elements)}}};
  }

  outcome::result<Value> Value::makeSequence(std::vector<Value> elements) {
    OUTCOME_TRY(checkHomogeneous(elements));
    return Value{Storage{VariableSequence{std::move(elements)}}};
  }

  outcome::result<Value> Value::makeUnsigned(PrimitiveType type,
                                             uint64_t value) {
    switch (type) {
      case PrimitiveType::kU8:
        return makeInteger<uint8_t>(value);
      case PrimitiveType::kI8:
        return makeInteger<int8_t>(value);
      case PrimitiveType::kU16:
        return makeInteger<uint16_t>(value);
      case PrimitiveType::kI16:
        return makeInteger<int16_t>(value);
      case PrimitiveType::kU32:
        return makeInteger<uint32_t>(value);
      case PrimitiveType::kI32:
        return makeInteger<int32_t>(value);
      case PrimitiveType::kU64:
        return makeInteger<uint64_t>(value);
      case PrimitiveType::kI64:
        return makeInteger<int64_t>(value);
      default:
        // floats are not counts
        return outcome::failure(BinwriteError::kUnrepresentableLength);
    }
  }

  Value Value::tuple(std::vector<Value> items) {
    Composite composite;
    composite.fields.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
      composite.fields.push_back(
          Field{std::to_string(i), std::move(items[i]), boost::none});
    }
    return Value{std::move(composite)};
  }

  Value::Kind Value::kind() const {
    return static_cast<Kind>(storage_.which());
  }

  const Value::Storage &Value::storage() const {
    return storage_;
  }

  PrimitiveType primitiveType(const Primitive &primitive) {
    return static_cast<PrimitiveType>(primitive.which());
  }

  bool sameType(const Value &lhs, const Value &rhs) {
    auto lhs_shape{shapeOf(lhs)};
    auto rhs_shape{shapeOf(rhs)};
    if (!lhs_shape || !rhs_shape) {
      return false;
    }
    return unify(lhs_shape.value(), rhs_shape.value());
  }

  CompositeBuilder &CompositeBuilder::field(std::string name,
                                            Value value,
                                            FieldEndian endian) {
    composite_.fields.push_back(
        Field{std::move(name), std::move(value), toOverride(endian)});
    return *this;
  }

  CompositeBuilder &CompositeBuilder::lengthPrefixed(std::string name,
                                                     PrimitiveType count_type,
                                                     Value sequence,
                                                     FieldEndian endian) {
    if (error_) {
      return *this;
    }
    auto count{sequenceSize(sequence)};
    if (!count) {
      log()->debug("length prefixed field '{}' is not a sequence", name);
      error_ = count.error();
      return *this;
    }
    auto count_value{Value::makeUnsigned(count_type, count.value())};
    if (!count_value) {
      log()->debug("length of field '{}' does not fit {}",
                   name,
                   common::to_string(count_type).value_or("?"));
      error_ = count_value.error();
      return *this;
    }
    field(name + "_len", std::move(count_value.value()), endian);
    return field(std::move(name), std::move(sequence), endian);
  }

  outcome::result<Value> CompositeBuilder::build() {
    if (error_) {
      return outcome::failure(*error_);
    }
    return Value{std::move(composite_)};
  }

  outcome::result<void> writeValue(const Value &value,
                                   Sink &sink,
                                   const WriterOption &options) {
    return boost::apply_visitor(
        [&](const auto &kind) -> outcome::result<void> {
          using T = std::decay_t<decltype(kind)>;
          if constexpr (std::is_same_v<T, Primitive>) {
            return boost::apply_visitor(
                [&](auto primitive) {
                  return writeOptions(primitive, sink, options);
                },
                kind);
          } else if constexpr (std::is_same_v<T, Composite>) {
            for (const auto &field : kind.fields) {
              OUTCOME_TRY(
                  writeValue(field.value, sink, resolve(options, field.endian)));
            }
            return outcome::success();
          } else {
            return writeEach(
                kind.elements.begin(), kind.elements.end(), sink, options);
          }
        },
        value.storage());
  }
}  // namespace bw::codec::binwrite
