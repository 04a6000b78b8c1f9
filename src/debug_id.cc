// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "debug_id.hpp"

#include "debug_id_format.hpp"
#include "debug_id_parser.hpp"
#include "debugid_res.hpp"

#include <absl/strings/str_format.h>

#include <algorithm>
#include <ostream>

namespace debugid {

DebugId DebugId::parse(std::string_view str) {
  DebugId id;
  DIRES_CHECK_THROW_EXCEPTION(parse_debug_id(str, id));
  return id;
}

bool DebugId::is_nil() const {
  return _appendix == 0 &&
      std::ranges::all_of(_uuid, [](uint8_t b) { return b == 0; });
}

std::string DebugId::to_string() const {
  return format_debug_id(*this, DebugIdFormat::kHyphenated);
}

std::string DebugId::to_debug_string() const {
  return absl::StrFormat(
      "DebugId { uuid: \"%s\", appendix: %u }",
      format_debug_id(DebugId(_uuid), DebugIdFormat::kHyphenated), _appendix);
}

std::ostream &operator<<(std::ostream &os, const DebugId &id) {
  return os << id.to_string();
}

} // namespace debugid
