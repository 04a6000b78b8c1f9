// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "code_id.hpp"
#include "debug_id.hpp"
#include "debugid_res_def.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace debugid {

enum class DebugIdEncoding : uint8_t {
  // "dfb8e43a-f242-3d73-a453-aeb6a777ef75-a"
  kString,
  // {"unique_id": "dfb8e43af2423d73a453aeb6a777ef75", "appendix": 10}
  kRecord,
};

inline constexpr const char *k_json_unique_id_key = "unique_id";
inline constexpr const char *k_json_appendix_key = "appendix";

nlohmann::json
    encode_debug_id(const DebugId &id,
                    DebugIdEncoding encoding = DebugIdEncoding::kString);

/// Accepts both encodings. The unique_id of a record may be compact or
/// hyphenated, without appendix.
DIRes decode_debug_id(const nlohmann::json &json, DebugId &id);

/// The string is kept verbatim, like the CodeId constructor does. Use
/// parse_code_id on the result to validate and normalize it.
DIRes decode_code_id(const nlohmann::json &json, CodeId &id);

// nlohmann ADL hooks, from_json throws a DIException on bad input
void to_json(nlohmann::json &json, const DebugId &id);
void from_json(const nlohmann::json &json, DebugId &id);
void to_json(nlohmann::json &json, const CodeId &id);
void from_json(const nlohmann::json &json, CodeId &id);

} // namespace debugid
