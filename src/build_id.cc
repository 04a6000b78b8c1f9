// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "build_id.hpp"

#include "guid_codec.hpp"
#include "hex_digits.hpp"

#include <algorithm>

namespace debugid {

BuildIdStr format_build_id(BuildIdSpan build_id_span) {
  std::string build_id_str;
  build_id_str.resize(build_id_span.size() * 2);
  for (int i = 0; auto c : build_id_span) {
    build_id_str[i++] = int_to_hex_digit(c >> k_hex_digit_bits);
    build_id_str[i++] = int_to_hex_digit(c & k_hex_digit_mask);
  }
  return build_id_str;
}

DebugId debug_id_from_build_id(BuildIdSpan build_id_span) {
  DebugIdBytes guid{};
  std::size_t const len = std::min(build_id_span.size(), guid.size());
  std::copy_n(build_id_span.begin(), len, guid.begin());
  return from_guid_bytes(guid);
}

} // namespace debugid
