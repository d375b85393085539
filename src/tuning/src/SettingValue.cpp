/**
 * @file SettingValue.cpp
 * @brief SettingValue construction and rendering.
 */

#include "src/tuning/inc/SettingValue.hpp"

#include <fmt/format.h>

namespace sysctlgen {

namespace tuning {

const char* toString(ValueKind kind) noexcept {
  switch (kind) {
  case ValueKind::INTEGER:
    return "integer";
  case ValueKind::WORD:
    return "word";
  case ValueKind::TUPLE:
    return "tuple";
  }
  return "unknown";
}

/* ----------------------------- Factories ----------------------------- */

SettingValue SettingValue::ofInt(std::int64_t value) {
  SettingValue out{};
  out.kind = ValueKind::INTEGER;
  out.integer = value;
  return out;
}

SettingValue SettingValue::ofWord(std::string_view value) {
  SettingValue out{};
  out.kind = ValueKind::WORD;
  out.word = std::string(value);
  return out;
}

SettingValue SettingValue::ofTuple(std::initializer_list<std::int64_t> values) {
  SettingValue out{};
  out.kind = ValueKind::TUPLE;
  out.tuple.assign(values.begin(), values.end());
  return out;
}

/* ----------------------------- Rendering ----------------------------- */

std::string SettingValue::toString() const {
  switch (kind) {
  case ValueKind::INTEGER:
    return fmt::format("{}", integer);
  case ValueKind::WORD:
    return word;
  case ValueKind::TUPLE:
    return fmt::format("{}", fmt::join(tuple, " "));
  }
  return {};
}

std::string SettingValue::toJson() const {
  if (kind == ValueKind::INTEGER) {
    return fmt::format("{}", integer);
  }
  // Words and tuples never contain quotes or backslashes
  return fmt::format("\"{}\"", toString());
}

bool SettingValue::operator==(const SettingValue& other) const noexcept {
  if (kind != other.kind) {
    return false;
  }
  switch (kind) {
  case ValueKind::INTEGER:
    return integer == other.integer;
  case ValueKind::WORD:
    return word == other.word;
  case ValueKind::TUPLE:
    return tuple == other.tuple;
  }
  return false;
}

} // namespace tuning

} // namespace sysctlgen
