// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "base/util/fs_wrapper.h"

#include <filesystem>
#include "base/common/file_util.h"
#include "base/common/logging.h"

namespace base {

bool LocalFSWrapper::PutData(const char *data, int64 size, const std::string &filename) {
  return base::WriteFile(filename, data, size);
}

bool LocalFSWrapper::GetData(const std::string &filename, std::string *file_data) {
  return base::ReadFileToString(filename, file_data);
}

bool LocalFSWrapper::IsDirectory(const std::string &path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

bool LocalFSWrapper::FileExists(const std::string &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

bool LocalFSWrapper::ExistOrCreateDirectory(const std::string &path) {
  return base::ExistOrCreateDirectory(path);
}

bool LocalFSWrapper::Rmr(const std::string &path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG(ERROR) << "Remove fail: " << path << ", error = " << ec.message();
    return false;
  }
  return true;
}

bool LocalFSWrapper::Move(const std::string &src, const std::string &dest) {
  std::error_code ec;
  if (IsDirectory(dest) && !Rmr(dest)) { return false; }
  // rename(2) replaces an existing regular file atomically.
  fs::rename(src, dest, ec);
  if (ec) {
    LOG(ERROR) << "Move " << src << " to " << dest << " fail, error = " << ec.message();
    return false;
  }
  return true;
}

}  // namespace base
