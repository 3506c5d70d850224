// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "base/jansson/json.h"

#include <cstdlib>

namespace base {

std::string JsonToString(const json_t *json, int indent) {
  if (json == nullptr) return "";
  char *dumped = json_dumps(json, JSON_INDENT(indent));
  if (dumped == nullptr) return "";
  std::string result(dumped);
  free(dumped);  // NOLINT
  return result;
}

Json::Json(json_t *json) : json_(json) {
  if (!json_is_object(json_)) return;
  const char *key;
  json_t *value;
  json_object_foreach(json_, key, value) {
    json_incref(value);
    object_map_[key] = std::make_unique<Json>(value);
  }
}

Json::~Json() {
  object_map_.clear();
  if (json_) json_decref(json_);
}

bool Json::StringValue(std::string *value) const {
  if (!json_is_string(json_)) return false;
  value->assign(json_string_value(json_), json_string_length(json_));
  return true;
}

bool Json::IntValue(int64 *value) const {
  if (!json_is_integer(json_)) return false;
  *value = json_integer_value(json_);
  return true;
}

Json *Json::Get(const std::string &key) const {
  auto it = object_map_.find(key);
  if (it != object_map_.end()) return it->second.get();
  return nullptr;
}

bool Json::GetInt(const std::string &key, int64 *value) const {
  auto element = Get(key);
  if (element) return element->IntValue(value);
  return false;
}

bool Json::GetString(const std::string &key, std::string *value) const {
  auto element = Get(key);
  if (element) return element->StringValue(value);
  return false;
}

}  // namespace base
