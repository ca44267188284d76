// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/ostream.h>

#include "utils/exceptions.hpp"

namespace batchcursor::cursor {

class Value;

/**
 * An ordered mapping of field names to values. Field order is the insertion
 * order, which is the order in which the server returned the fields.
 *
 * Member functions are defined out of line because `Value` is incomplete here.
 */
class Document {
 public:
  using Field = std::pair<std::string, Value>;
  using const_iterator = std::vector<Field>::const_iterator;

  Document();
  Document(std::initializer_list<Field> fields);

  Document(const Document &);
  Document(Document &&) noexcept;
  Document &operator=(const Document &);
  Document &operator=(Document &&) noexcept;
  ~Document();

  /// Overwrites the field in place when it exists, appends it otherwise.
  Document &Set(std::string_view name, Value value);

  /// Returns nullptr when the field doesn't exist.
  const Value *Get(std::string_view name) const;
  Value *Get(std::string_view name);

  /// Same as `Get` but throws `ValueException` when the field doesn't exist.
  const Value &At(std::string_view name) const;

  bool Contains(std::string_view name) const;

  /// Returns whether a field was removed.
  bool Erase(std::string_view name);

  size_t size() const;
  bool empty() const;

  const_iterator begin() const;
  const_iterator end() const;

  friend bool operator==(const Document &a, const Document &b);

 private:
  std::vector<Field> fields_;
};

/**
 * Stores a document field value and its type.
 *
 * `Null` is a legitimate payload (the explicit "absent" marker). It must not be
 * confused with an empty `std::optional<Value>`, which the cursor uses to signal
 * that no value was produced at all.
 */
class Value {
 public:
  enum class Type : uint8_t { Null, Bool, Int, Double, String, List, Document };

  using List = std::vector<Value>;

  /** Creates a Null value. */
  Value() = default;

  // single argument constructors are intentionally implicit, `Value v = 5;` reads naturally
  Value(bool value) : value_(value) {}                          // NOLINT(hicpp-explicit-conversions)
  // Every integer type is stored as int64_t, unsigned values above its range wrap.
  template <std::integral T>
  requires(!std::same_as<T, bool>) Value(T value)  // NOLINT(hicpp-explicit-conversions)
      : value_(static_cast<int64_t>(value)) {}
  Value(double value) : value_(value) {}                        // NOLINT(hicpp-explicit-conversions)
  Value(const char *value) : value_(std::string(value)) {}      // NOLINT(hicpp-explicit-conversions)
  Value(std::string_view value) : value_(std::string(value)) {} // NOLINT(hicpp-explicit-conversions)
  Value(std::string value) : value_(std::move(value)) {}        // NOLINT(hicpp-explicit-conversions)
  Value(List value) : value_(std::move(value)) {}               // NOLINT(hicpp-explicit-conversions)
  Value(Document value) : value_(std::move(value)) {}           // NOLINT(hicpp-explicit-conversions)

  Type type() const { return static_cast<Type>(value_.index()); }

  bool IsNull() const { return type() == Type::Null; }
  bool IsBool() const { return type() == Type::Bool; }
  bool IsInt() const { return type() == Type::Int; }
  bool IsDouble() const { return type() == Type::Double; }
  bool IsString() const { return type() == Type::String; }
  bool IsList() const { return type() == Type::List; }
  bool IsDocument() const { return type() == Type::Document; }

  /// Typed getters throw `ValueException` on a type mismatch.
  bool ValueBool() const;
  int64_t ValueInt() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const List &ValueList() const;
  const Document &ValueDocument() const;
  Document &ValueDocument();

  /**
   * Structural equality. Values of different types are never equal, so
   * `Int 0`, `Bool false`, `String ""` and `Null` are all distinct. Two NaN
   * doubles are considered equal, which makes result comparison in tests
   * meaningful.
   */
  friend bool operator==(const Value &a, const Value &b);

  friend std::ostream &operator<<(std::ostream &os, const Value &value);

 private:
  std::variant<std::monostate, bool, int64_t, double, std::string, List, Document> value_;
};

std::ostream &operator<<(std::ostream &os, Value::Type type);
std::ostream &operator<<(std::ostream &os, const Document &document);

/**
 * An exception raised when a value is accessed as a type it doesn't hold.
 */
class ValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

}  // namespace batchcursor::cursor

template <>
class fmt::formatter<batchcursor::cursor::Value> : public fmt::ostream_formatter {};
template <>
class fmt::formatter<batchcursor::cursor::Document> : public fmt::ostream_formatter {};
template <>
class fmt::formatter<batchcursor::cursor::Value::Type> : public fmt::ostream_formatter {};
