// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "semview/nlp/views/extractor-params.h"

#include <errno.h>
#include <stdlib.h>
#include <limits>

namespace semview {
namespace nlp {

void ExtractorParams::Add(const string &name, const string &value) {
  parameters_.emplace_back(name, value);
}

void ExtractorParams::Add(const string &name, const char *value) {
  Add(name, string(value));
}

void ExtractorParams::Add(const string &name, int value) {
  Add(name, std::to_string(value));
}

void ExtractorParams::Add(const string &name, bool value) {
  Add(name, string(value ? "true" : "false"));
}

const string *ExtractorParams::Find(const string &name) const {
  for (auto it = parameters_.rbegin(); it != parameters_.rend(); ++it) {
    if (it->name == name) return &it->value;
  }
  return nullptr;
}

Status ExtractorParams::Get(const string &name, const string &defval,
                            string *value) const {
  const string *v = Find(name);
  *value = v != nullptr ? *v : defval;
  return Status::OK;
}

Status ExtractorParams::Get(const string &name, int defval, int *value) const {
  const string *v = Find(name);
  if (v == nullptr) {
    *value = defval;
    return Status::OK;
  }

  errno = 0;
  char *end = nullptr;
  long number = strtol(v->c_str(), &end, 10);
  if (v->empty() || *end != '\0' || errno != 0 ||
      number < std::numeric_limits<int>::min() ||
      number > std::numeric_limits<int>::max()) {
    return Status(INVALID_CONFIGURATION,
                  "Parameter '" + name + "' is not an integer: " + *v);
  }
  *value = static_cast<int>(number);
  return Status::OK;
}

Status ExtractorParams::Get(const string &name, bool defval,
                            bool *value) const {
  const string *v = Find(name);
  if (v == nullptr) {
    *value = defval;
  } else if (*v == "true" || *v == "1") {
    *value = true;
  } else if (*v == "false" || *v == "0") {
    *value = false;
  } else {
    return Status(INVALID_CONFIGURATION,
                  "Parameter '" + name + "' is not a boolean: " + *v);
  }
  return Status::OK;
}

Status ExtractorParams::GetRequired(const string &name, int *value) const {
  if (!Has(name)) {
    return Status(INVALID_CONFIGURATION,
                  "Missing required parameter '" + name + "'");
  }
  return Get(name, 0, value);
}

}  // namespace nlp
}  // namespace semview
