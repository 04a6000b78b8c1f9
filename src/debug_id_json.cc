// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "debug_id_json.hpp"

#include "debug_id_format.hpp"
#include "debug_id_parser.hpp"
#include "debugid_res.hpp"

#include <limits>
#include <string>

namespace debugid {

namespace {
DIRes decode_record(const nlohmann::json &json, DebugId &id) {
  auto const uuid_it = json.find(k_json_unique_id_key);
  DIRES_CHECK_BOOL(uuid_it != json.end() && uuid_it->is_string(),
                   DI_WHAT_INVALID_JSON, "Missing string field %s",
                   k_json_unique_id_key);
  DebugIdBytes uuid;
  DIRES_CHECK_FWD(parse_uuid(uuid_it->get_ref<const std::string &>(), uuid));

  uint32_t appendix = 0;
  auto const appendix_it = json.find(k_json_appendix_key);
  if (appendix_it != json.end() && !appendix_it->is_null()) {
    DIRES_CHECK_BOOL(appendix_it->is_number_integer(),
                     DI_WHAT_INVALID_APPENDIX, "Field %s is not an integer",
                     k_json_appendix_key);
    // literals built in C++ are signed, parsed documents are unsigned
    DIRES_CHECK_BOOL(appendix_it->is_number_unsigned() ||
                         appendix_it->get<int64_t>() >= 0,
                     DI_WHAT_INVALID_APPENDIX, "Field %s is negative",
                     k_json_appendix_key);
    auto const value = appendix_it->get<uint64_t>();
    DIRES_CHECK_BOOL(value <= std::numeric_limits<uint32_t>::max(),
                     DI_WHAT_INVALID_APPENDIX,
                     "Field %s does not fit in 32 bits (%lu)",
                     k_json_appendix_key, static_cast<unsigned long>(value));
    appendix = static_cast<uint32_t>(value);
  }
  id = DebugId(uuid, appendix);
  return dires_init();
}
} // namespace

nlohmann::json encode_debug_id(const DebugId &id, DebugIdEncoding encoding) {
  if (encoding == DebugIdEncoding::kRecord) {
    DebugId const uuid_only(id.uuid());
    return nlohmann::json{
        {k_json_unique_id_key,
         format_debug_id(uuid_only, DebugIdFormat::kCompact)},
        {k_json_appendix_key, id.appendix()}};
  }
  return format_debug_id(id, DebugIdFormat::kHyphenated);
}

DIRes decode_debug_id(const nlohmann::json &json, DebugId &id) {
  if (json.is_string()) {
    return parse_debug_id(json.get_ref<const std::string &>(), id);
  }
  if (json.is_object()) {
    return decode_record(json, id);
  }
  DIRES_RETURN_ERROR_LOG(DI_WHAT_INVALID_JSON,
                         "Debug id should be a string or an object, got %s",
                         json.type_name());
}

DIRes decode_code_id(const nlohmann::json &json, CodeId &id) {
  DIRES_CHECK_BOOL(json.is_string(), DI_WHAT_INVALID_JSON,
                   "Code id should be a string, got %s", json.type_name());
  id = CodeId(json.get<std::string>());
  return dires_init();
}

void to_json(nlohmann::json &json, const DebugId &id) {
  json = encode_debug_id(id);
}

void from_json(const nlohmann::json &json, DebugId &id) {
  DIRES_CHECK_THROW_EXCEPTION(decode_debug_id(json, id));
}

void to_json(nlohmann::json &json, const CodeId &id) { json = id.as_str(); }

void from_json(const nlohmann::json &json, CodeId &id) {
  DIRES_CHECK_THROW_EXCEPTION(decode_code_id(json, id));
}

} // namespace debugid
