// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "base/common/file_util.h"

#include <fstream>
#include <iterator>
#include "base/common/logging.h"

namespace base {

bool ReadFileToString(const fs::path &file_path, std::string *content) {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    LOG(WARNING) << "Not a regular file: " << file_path.string();
    return false;
  }
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    LOG(WARNING) << "Cannot open file: " << file_path.string();
    return false;
  }
  content->assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    LOG(WARNING) << "Read file error: " << file_path.string();
    return false;
  }
  return true;
}

bool WriteFile(const std::string &file_path, const char *buf, int64_t buf_len) {
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG(ERROR) << "Error opening file: " << file_path;
    return false;
  }
  file.write(buf, buf_len);
  file.flush();
  if (!file.good()) {
    LOG(ERROR) << "Error writing " << buf_len << " bytes to file: " << file_path;
    return false;
  }
  file.close();
  return !file.fail();
}

bool ExistOrCreateDirectory(const std::string &path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) { return true; }
  if (fs::is_regular_file(path, ec)) { fs::remove_all(path, ec); }
  fs::create_directories(path, ec);
  if (ec) {
    LOG(ERROR) << "Create directory fail: " << path << ", error = " << ec.message();
    return false;
  }
  return true;
}

}  // namespace base
