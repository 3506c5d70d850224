// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <utility>

#include "base/common/basic_types.h"

namespace base {

// Runs `f` when leaving the scope, also when unwinding through an exception.
class ScopeExit {
 public:
  explicit ScopeExit(std::function<void()> f) : func_(std::move(f)) {}
  ~ScopeExit() { func_(); }

 private:
  std::function<void()> func_;

  DISALLOW_COPY_AND_ASSIGN(ScopeExit);
};

}  // namespace base
