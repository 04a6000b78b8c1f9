// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "code_id.hpp"

#include "build_id.hpp"
#include "debugid_res.hpp"
#include "hex_digits.hpp"

#include <absl/strings/ascii.h>

#include <ostream>

namespace debugid {

CodeId CodeId::from_binary(std::span<const uint8_t> bytes) {
  return CodeId(format_build_id(bytes));
}

DIRes parse_code_id(std::string_view str, CodeId &code_id) {
  DIRES_CHECK_BOOL(str.size() % 2 == 0, DI_WHAT_INVALID_LENGTH,
                   "Code id %.*s has an odd number of digits",
                   static_cast<int>(str.size()), str.data());
  DIRES_CHECK_BOOL(is_hex_string(str), DI_WHAT_INVALID_CHARACTER,
                   "Code id %.*s is not hexadecimal",
                   static_cast<int>(str.size()), str.data());
  code_id = CodeId(absl::AsciiStrToLower(absl::string_view(str.data(), str.size())));
  return dires_init();
}

std::ostream &operator<<(std::ostream &os, const CodeId &id) {
  return os << id.as_str();
}

} // namespace debugid
