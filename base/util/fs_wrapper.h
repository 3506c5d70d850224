// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once
#include <string>
#include "base/common/basic_types.h"

namespace base {

/**
 * Filesystem seen by persistence code, so that saves can target another storage and tests
 * can inject faults. Every call returns true on success and logs the cause of a failure.
 */
class FSWrapper {
 public:
  FSWrapper() {}
  virtual ~FSWrapper() {}

  // Create or truncate `filename` and write `size` bytes of `data`.
  virtual bool PutData(const char *data, int64 size, const std::string &filename) = 0;

  // Whole content of a regular file.
  virtual bool GetData(const std::string &filename, std::string *file_data) = 0;

  virtual bool IsDirectory(const std::string &path) = 0;

  // Regular files only, false for a directory.
  virtual bool FileExists(const std::string &path) = 0;

  // A regular file at `path` is replaced by the directory.
  virtual bool ExistOrCreateDirectory(const std::string &path) = 0;

  // Recursive remove, a missing `path` counts as removed.
  virtual bool Rmr(const std::string &path) = 0;

  // Rename `src` over `dest`. Readers of `dest` see the old or the new file, never a partial one.
  virtual bool Move(const std::string &src, const std::string &dest) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(FSWrapper);
};

// Local filesystem wrapper.
class LocalFSWrapper : public FSWrapper {
 public:
  LocalFSWrapper() {}
  ~LocalFSWrapper() override {}

  bool PutData(const char *data, int64 size, const std::string &filename) override;
  bool GetData(const std::string &filename, std::string *file_data) override;
  bool IsDirectory(const std::string &path) override;
  bool FileExists(const std::string &path) override;
  bool ExistOrCreateDirectory(const std::string &path) override;
  bool Rmr(const std::string &path) override;
  bool Move(const std::string &src, const std::string &dest) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(LocalFSWrapper);
};

}  // namespace base
