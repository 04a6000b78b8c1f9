// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "debug_id_format.hpp"

#include "hex_digits.hpp"

#include <absl/strings/str_cat.h>

namespace debugid {

namespace {
// Byte offsets followed by a hyphen in the 8-4-4-4-12 layout
constexpr bool is_group_end(std::size_t byte_idx) {
  return byte_idx == 3 || byte_idx == 5 || byte_idx == 7 || byte_idx == 9;
}

constexpr std::size_t k_hyphenated_len = 36;
constexpr std::size_t k_max_appendix_len = 9; // separator and 8 digits

void append_uuid(std::string &str, const DebugIdBytes &uuid, bool hyphenated,
                 bool upper) {
  for (std::size_t i = 0; i < uuid.size(); ++i) {
    str.push_back(int_to_hex_digit(uuid[i] >> k_hex_digit_bits, upper));
    str.push_back(int_to_hex_digit(uuid[i] & k_hex_digit_mask, upper));
    if (hyphenated && is_group_end(i)) {
      str.push_back('-');
    }
  }
}
} // namespace

void append_debug_id(std::string &str, const DebugId &id,
                     DebugIdFormat format) {
  str.reserve(str.size() + k_hyphenated_len + k_max_appendix_len);
  switch (format) {
  case DebugIdFormat::kBreakpad:
    append_uuid(str, id.uuid(), false, true);
    absl::StrAppend(&str, absl::Hex(id.appendix()));
    break;
  case DebugIdFormat::kCompact:
    append_uuid(str, id.uuid(), false, false);
    if (id.appendix() != 0) {
      absl::StrAppend(&str, absl::Hex(id.appendix()));
    }
    break;
  case DebugIdFormat::kHyphenated:
    append_uuid(str, id.uuid(), true, false);
    if (id.appendix() != 0) {
      absl::StrAppend(&str, "-", absl::Hex(id.appendix()));
    }
    break;
  }
}

std::string format_debug_id(const DebugId &id, DebugIdFormat format) {
  std::string str;
  append_debug_id(str, id, format);
  return str;
}

} // namespace debugid
