// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "debugid_res_list.hpp"

#include <iterator>

namespace {
const char *const s_common_error_messages[] = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

const char *const s_codec_error_messages[] = {
    CODEC_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

static_assert(std::size(s_common_error_messages) ==
                  COMMON_ERROR_SIZE - DI_COMMON_START_RANGE - 1,
              "common error table out of sync");
static_assert(std::size(s_codec_error_messages) ==
                  CODEC_ERROR_SIZE - DI_CODEC_START_RANGE - 1,
              "codec error table out of sync");
} // namespace

const char *dires_error_message(int16_t what) {
  if (what > DI_WHAT_MIN_ERRNO && what < COMMON_ERROR_SIZE) {
    return s_common_error_messages[what - DI_WHAT_MIN_ERRNO - 1];
  }
  if (what > DI_WHAT_MIN_CODEC && what < CODEC_ERROR_SIZE) {
    return s_codec_error_messages[what - DI_WHAT_MIN_CODEC - 1];
  }
  return "Unknown error. Please update " __FILE__ ".";
}
