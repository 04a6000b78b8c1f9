// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debug_id.hpp"

#include <span>
#include <string>

namespace debugid {
using BuildIdSpan = std::span<const unsigned char>;
using BuildIdStr = std::string;

// Lower case hex of the NT_GNU_BUILD_ID note
BuildIdStr format_build_id(BuildIdSpan build_id_span);

// Breakpad convention for ELF modules: the first 16 bytes of the build-id
// (zero padded when shorter) are read as a little-endian GUID.
DebugId debug_id_from_build_id(BuildIdSpan build_id_span);

} // namespace debugid
