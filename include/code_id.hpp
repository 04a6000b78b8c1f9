// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debugid_res_def.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace debugid {

/// Identifier of the code file itself (ELF build-id, PE timestamp and size,
/// Mach-O UUID), kept as a hex string of platform dependent length.
class CodeId {
public:
  CodeId() = default; // nil
  // Stored as is, case included
  explicit CodeId(std::string str) : _str(std::move(str)) {}

  // Lower case hex of the bytes
  static CodeId from_binary(std::span<const uint8_t> bytes);

  [[nodiscard]] const std::string &as_str() const { return _str; }
  [[nodiscard]] bool is_nil() const { return _str.empty(); }

  friend bool operator==(const CodeId &, const CodeId &) = default;
  friend auto operator<=>(const CodeId &, const CodeId &) = default;

  template <typename H> friend H AbslHashValue(H h, const CodeId &id) {
    return H::combine(std::move(h), id._str);
  }

private:
  std::string _str;
};

/// Checks for an even number of hex digits, stores them in lower case.
/// Errors: DI_WHAT_INVALID_LENGTH, DI_WHAT_INVALID_CHARACTER
DIRes parse_code_id(std::string_view str, CodeId &code_id);

std::ostream &operator<<(std::ostream &os, const CodeId &id);

} // namespace debugid

namespace std {
template <> struct hash<debugid::CodeId> {
  std::size_t operator()(const debugid::CodeId &id) const {
    return std::hash<std::string>{}(id.as_str());
  }
};
} // namespace std
