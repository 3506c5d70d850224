// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

#include "absl/flags/declare.h"
#include "absl/flags/flag.h"
#include "base/common/basic_types.h"
