// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debug_id.hpp"

#include <cstdint>
#include <string>

namespace debugid {

enum class DebugIdFormat : uint8_t {
  // dfb8e43a-f242-3d73-a453-aeb6a777ef75-a
  kHyphenated,
  // DFB8E43AF2423D73A453AEB6A777EF75a (appendix always present)
  kBreakpad,
  // dfb8e43af2423d73a453aeb6a777ef75a
  kCompact,
};

// Never fails
std::string format_debug_id(const DebugId &id,
                            DebugIdFormat format = DebugIdFormat::kHyphenated);

// Same as above, appends to an existing string
void append_debug_id(std::string &str, const DebugId &id,
                     DebugIdFormat format = DebugIdFormat::kHyphenated);

} // namespace debugid
