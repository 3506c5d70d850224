// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace base {

// Read the whole file into `content`. Returns false if the file is missing or unreadable.
bool ReadFileToString(const fs::path &file_path, std::string *content);

// Create or truncate `file_path` and write `buf_len` bytes to it.
// Returns true only when every byte reached the file and it was closed cleanly.
bool WriteFile(const std::string &file_path, const char *buf, int64_t buf_len);

bool ExistOrCreateDirectory(const std::string &path);

}  // namespace base
