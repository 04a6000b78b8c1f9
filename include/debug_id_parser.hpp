// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debug_id.hpp"
#include "debugid_res_def.hpp"

#include <string_view>

namespace debugid {

/// Parse a debug identifier from any of the accepted layouts (hex digits are
/// case insensitive):
///   - dfb8e43a-f242-3d73-a453-aeb6a777ef75          (appendix 0)
///   - dfb8e43a-f242-3d73-a453-aeb6a777ef75-a        ('-' or ' ' separator)
///   - dfb8e43af2423d73a453aeb6a777ef75a             (breakpad)
///   - dfb8e43af2423d73a453aeb6a777ef75-a
/// The appendix is always read as hexadecimal and may have any width as long
/// as it fits in 32 bits.
/// Errors: DI_WHAT_INVALID_LENGTH, DI_WHAT_INVALID_CHARACTER,
/// DI_WHAT_INVALID_APPENDIX. id is only written on success.
DIRes parse_debug_id(std::string_view str, DebugId &id);

/// Strict breakpad layout: 32 hex digits immediately followed by 1 to 8 hex
/// digits of appendix. Any separator is DI_WHAT_INVALID_CHARACTER.
DIRes parse_breakpad_id(std::string_view str, DebugId &id);

/// Only the 128 bit body (hyphenated or compact), nothing may follow
DIRes parse_uuid(std::string_view str, DebugIdBytes &uuid);

} // namespace debugid
