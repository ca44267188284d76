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

#include "cursor/value.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>

namespace batchcursor::cursor {

Document::Document() = default;
Document::Document(std::initializer_list<Field> fields) {
  fields_.reserve(fields.size());
  for (const auto &[name, value] : fields) {
    Set(name, value);
  }
}
Document::Document(const Document &) = default;
Document::Document(Document &&) noexcept = default;
Document &Document::operator=(const Document &) = default;
Document &Document::operator=(Document &&) noexcept = default;
Document::~Document() = default;

Document &Document::Set(std::string_view name, Value value) {
  if (auto *existing = Get(name)) {
    *existing = std::move(value);
  } else {
    fields_.emplace_back(std::string(name), std::move(value));
  }
  return *this;
}

const Value *Document::Get(std::string_view name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(), [name](const auto &field) { return field.first == name; });
  return it == fields_.end() ? nullptr : &it->second;
}

Value *Document::Get(std::string_view name) {
  return const_cast<Value *>(static_cast<const Document *>(this)->Get(name));
}

const Value &Document::At(std::string_view name) const {
  const auto *value = Get(name);
  if (!value) throw ValueException("Document has no field '{}'.", name);
  return *value;
}

bool Document::Contains(std::string_view name) const { return Get(name) != nullptr; }

bool Document::Erase(std::string_view name) {
  auto it = std::find_if(fields_.begin(), fields_.end(), [name](const auto &field) { return field.first == name; });
  if (it == fields_.end()) return false;
  fields_.erase(it);
  return true;
}

size_t Document::size() const { return fields_.size(); }
bool Document::empty() const { return fields_.empty(); }
Document::const_iterator Document::begin() const { return fields_.begin(); }
Document::const_iterator Document::end() const { return fields_.end(); }

bool operator==(const Document &a, const Document &b) { return a.fields_ == b.fields_; }

namespace {

template <typename T>
const T &GetAs(const auto &variant, Value::Type expected, Value::Type actual) {
  const auto *value = std::get_if<T>(&variant);
  if (!value) throw ValueException("Expected a value of type {}, got {}.", expected, actual);
  return *value;
}

}  // namespace

bool Value::ValueBool() const { return GetAs<bool>(value_, Type::Bool, type()); }
int64_t Value::ValueInt() const { return GetAs<int64_t>(value_, Type::Int, type()); }
double Value::ValueDouble() const { return GetAs<double>(value_, Type::Double, type()); }
const std::string &Value::ValueString() const { return GetAs<std::string>(value_, Type::String, type()); }
const Value::List &Value::ValueList() const { return GetAs<List>(value_, Type::List, type()); }
const Document &Value::ValueDocument() const { return GetAs<Document>(value_, Type::Document, type()); }
Document &Value::ValueDocument() { return const_cast<Document &>(static_cast<const Value *>(this)->ValueDocument()); }

bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type()) return false;
  if (a.IsDouble()) {
    const auto x = a.ValueDouble();
    const auto y = b.ValueDouble();
    return (std::isnan(x) && std::isnan(y)) || x == y;
  }
  return a.value_ == b.value_;
}

std::ostream &operator<<(std::ostream &os, const Value::Type type) {
  switch (type) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << "bool";
    case Value::Type::Int:
      return os << "int";
    case Value::Type::Double:
      return os << "double";
    case Value::Type::String:
      return os << "string";
    case Value::Type::List:
      return os << "list";
    case Value::Type::Document:
      return os << "document";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Document &document) {
  os << "{";
  bool first = true;
  for (const auto &[name, value] : document) {
    if (!first) os << ", ";
    first = false;
    os << std::quoted(name) << ": " << value;
  }
  return os << "}";
}

std::ostream &operator<<(std::ostream &os, const Value &value) {
  switch (value.type()) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::Int:
      return os << value.ValueInt();
    case Value::Type::Double:
      return os << value.ValueDouble();
    case Value::Type::String:
      return os << std::quoted(value.ValueString());
    case Value::Type::List: {
      os << "[";
      const auto &list = value.ValueList();
      for (size_t i = 0; i < list.size(); ++i) {
        if (i != 0) os << ", ";
        os << list[i];
      }
      return os << "]";
    }
    case Value::Type::Document:
      return os << value.ValueDocument();
  }
  return os;
}

}  // namespace batchcursor::cursor
