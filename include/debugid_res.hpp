// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "debugid_res_def.hpp"
#include "debugid_res_exception.hpp"
#include "debugid_res_helpers.hpp"
#include "debugid_res_list.hpp"
