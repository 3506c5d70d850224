// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <jansson.h>

#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>

#include "base/common/basic_types.h"

namespace base {

// Returns nullptr when `json_string` is not valid json.
inline json_t *StringToJson(const std::string &json_string) {
  json_error_t json_error;
  return json_loadb(json_string.data(), json_string.size(), 0, &json_error);
}

std::string JsonToString(const json_t *json, int indent = 0);

/**
 * \brief Read-only wrapper for jansson objects.
 * Takes over one reference of the wrapped json_t.
 */
class Json {
 public:
  explicit Json(json_t *json);
  ~Json();

  std::string ToString(int indent = 0) const { return JsonToString(json_, indent); }

  bool IsNull() const { return json_ == nullptr || json_is_null(json_); }
  bool IsObject() const { return json_is_object(json_); }

  bool StringValue(std::string *value) const;
  std::string StringValue(std::string default_value) const {
    StringValue(&default_value);
    return default_value;
  }
  bool IntValue(int64 *value) const;
  int64 IntValue(int64 default_value) const {
    IntValue(&default_value);
    return default_value;
  }

  // object accessor, nullptr if `key` is absent or this is not an object.
  Json *Get(const std::string &key) const;
  bool GetInt(const std::string &key, int64 *value) const;
  bool GetString(const std::string &key, std::string *value) const;
  int64 GetInt(const std::string &key, int64 default_value) const {
    GetInt(key, &default_value);
    return default_value;
  }
  std::string GetString(const std::string &key, std::string default_value) const {
    GetString(key, &default_value);
    return default_value;
  }

  json_t *get() const { return json_; }

  friend std::ostream &operator<<(std::ostream &out, const Json &json) {
    return json.IsNull() ? out << "NULL" : out << json.ToString();
  }

 private:
  json_t *json_;
  std::unordered_map<std::string, std::unique_ptr<Json>> object_map_;

  DISALLOW_COPY_AND_ASSIGN(Json);
};

}  // namespace base
