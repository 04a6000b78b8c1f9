// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

namespace debugid {

/// log_mode: stdout, stderr, disabled or a file path (nullptr is stderr)
/// log_level: debug, informational, notice, warn, error (default warn)
/// Returns false when the log file could not be opened.
bool setup_logger(const char *log_mode, const char *log_level,
                  const char *name = nullptr);

} // namespace debugid
