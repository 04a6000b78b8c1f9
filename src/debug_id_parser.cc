// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "debug_id_parser.hpp"

#include "debugid_res.hpp"
#include "hex_digits.hpp"

#include <absl/strings/numbers.h>

#include <array>

namespace debugid {

namespace {
constexpr std::size_t k_uuid_hex_digits = k_debug_id_size * 2;
constexpr std::array<std::size_t, 4> k_hyphen_offsets = {8, 13, 18, 23};
constexpr std::size_t k_hyphenated_len =
    k_uuid_hex_digits + k_hyphen_offsets.size();
constexpr std::size_t k_breakpad_max_appendix_digits = 8;

inline bool is_separator(char c) { return c == '-' || c == ' '; }

// Reads the 128 bit body at the start of str.
// The character at the first hyphen offset selects the layout: a hyphen
// means 8-4-4-4-12, anything else means 32 contiguous digits.
DIRes parse_body(std::string_view str, DebugIdBytes &uuid,
                 std::size_t &consumed) {
  bool const hyphenated =
      str.size() > k_hyphen_offsets[0] && str[k_hyphen_offsets[0]] == '-';
  DebugIdBytes bytes{};
  std::size_t pos = 0;
  std::size_t next_hyphen = 0;
  for (std::size_t nibble = 0; nibble < k_uuid_hex_digits;) {
    if (pos >= str.size()) {
      DIRES_RETURN_ERROR_LOG(DI_WHAT_INVALID_LENGTH,
                             "Debug id body too short (%zu characters)",
                             str.size());
    }
    char const c = str[pos];
    if (hyphenated && next_hyphen < k_hyphen_offsets.size() &&
        pos == k_hyphen_offsets[next_hyphen]) {
      DIRES_CHECK_BOOL(c == '-', DI_WHAT_INVALID_CHARACTER,
                       "Expected hyphen at offset %zu, found '%c'", pos, c);
      ++next_hyphen;
      ++pos;
      continue;
    }
    int const value = hex_digit_to_int(c);
    DIRES_CHECK_BOOL(value >= 0, DI_WHAT_INVALID_CHARACTER,
                     "Unexpected character '%c' at offset %zu", c, pos);
    bytes[nibble / 2] |= (nibble % 2 == 0)
        ? static_cast<uint8_t>(value << k_hex_digit_bits)
        : static_cast<uint8_t>(value);
    ++nibble;
    ++pos;
  }
  uuid = bytes;
  consumed = pos;
  return dires_init();
}

DIRes parse_appendix(std::string_view str, uint32_t &appendix) {
  DIRES_CHECK_BOOL(!str.empty(), DI_WHAT_INVALID_APPENDIX,
                   "Separator is not followed by an appendix");
  // SimpleHexAtoi tolerates whitespace, signs and a 0x prefix: only digits
  // are valid here.
  DIRES_CHECK_BOOL(is_hex_string(str), DI_WHAT_INVALID_APPENDIX,
                   "Appendix %.*s is not hexadecimal",
                   static_cast<int>(str.size()), str.data());
  uint32_t value = 0;
  DIRES_CHECK_BOOL(absl::SimpleHexAtoi(absl::string_view(str.data(), str.size()), &value), DI_WHAT_INVALID_APPENDIX,
                   "Appendix %.*s does not fit in 32 bits",
                   static_cast<int>(str.size()), str.data());
  appendix = value;
  return dires_init();
}
} // namespace

DIRes parse_debug_id(std::string_view str, DebugId &id) {
  DebugIdBytes uuid;
  std::size_t consumed = 0;
  DIRES_CHECK_FWD(parse_body(str, uuid, consumed));

  std::string_view tail = str.substr(consumed);
  uint32_t appendix = 0;
  if (!tail.empty()) {
    if (is_separator(tail.front())) {
      tail.remove_prefix(1);
    } else if (consumed == k_hyphenated_len) {
      // a hyphenated body ends on its 12 digit group, a hex digit here means
      // the last group is too long
      DIRES_CHECK_BOOL(hex_digit_to_int(tail.front()) < 0,
                       DI_WHAT_INVALID_LENGTH,
                       "Last group of %.*s is longer than 12 digits",
                       static_cast<int>(str.size()), str.data());
      DIRES_RETURN_ERROR_LOG(DI_WHAT_INVALID_CHARACTER,
                             "Unexpected character '%c' after debug id body",
                             tail.front());
    }
    DIRES_CHECK_FWD(parse_appendix(tail, appendix));
  }
  id = DebugId(uuid, appendix);
  return dires_init();
}

DIRes parse_breakpad_id(std::string_view str, DebugId &id) {
  DIRES_CHECK_BOOL(str.size() > k_uuid_hex_digits, DI_WHAT_INVALID_LENGTH,
                   "Breakpad id %.*s is too short",
                   static_cast<int>(str.size()), str.data());
  // No separator anywhere, body and appendix are plain hex digits
  for (std::size_t pos = 0; pos < str.size(); ++pos) {
    DIRES_CHECK_BOOL(hex_digit_to_int(str[pos]) >= 0,
                     DI_WHAT_INVALID_CHARACTER,
                     "Unexpected character '%c' at offset %zu", str[pos], pos);
  }
  DIRES_CHECK_BOOL(str.size() <=
                       k_uuid_hex_digits + k_breakpad_max_appendix_digits,
                   DI_WHAT_INVALID_APPENDIX, "Breakpad id %.*s is too long",
                   static_cast<int>(str.size()), str.data());
  DebugIdBytes uuid;
  std::size_t consumed = 0;
  DIRES_CHECK_FWD(
      parse_body(str.substr(0, k_uuid_hex_digits), uuid, consumed));
  uint32_t appendix = 0;
  DIRES_CHECK_FWD(parse_appendix(str.substr(k_uuid_hex_digits), appendix));
  id = DebugId(uuid, appendix);
  return dires_init();
}

DIRes parse_uuid(std::string_view str, DebugIdBytes &uuid) {
  DebugIdBytes bytes;
  std::size_t consumed = 0;
  DIRES_CHECK_FWD(parse_body(str, bytes, consumed));
  DIRES_CHECK_BOOL(consumed == str.size(), DI_WHAT_INVALID_LENGTH,
                   "Unexpected trailing characters after uuid %.*s",
                   static_cast<int>(str.size()), str.data());
  uuid = bytes;
  return dires_init();
}

} // namespace debugid
