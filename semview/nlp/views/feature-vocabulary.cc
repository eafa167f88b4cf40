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

#include "semview/nlp/views/feature-vocabulary.h"

#include <stdio.h>

#include "semview/base/logging.h"

namespace semview {
namespace nlp {

void FeatureVocabulary::Build(int size, int offset) {
  CHECK_GE(size, 0);
  entries_.clear();
  entries_.reserve(size);
  for (int i = 0; i < size; ++i) {
    entries_.emplace_back(LabelName(i), offset + i);
  }
  offset_ = offset;
}

void FeatureVocabulary::Rebase(int new_offset) {
  for (auto &entry : entries_) {
    entry.second = entry.second - offset_ + new_offset;
  }
  offset_ = new_offset;
}

string FeatureVocabulary::LabelName(int index) {
  char name[16];
  snprintf(name, sizeof(name), "C%02d", index);
  return name;
}

int FeatureVocabulary::Lookup(const string &name) const {
  for (const auto &entry : entries_) {
    if (entry.first == name) return entry.second;
  }
  return -1;
}

std::unordered_map<string, int> FeatureVocabulary::name_to_id() const {
  std::unordered_map<string, int> mapping;
  for (const auto &entry : entries_) mapping[entry.first] = entry.second;
  return mapping;
}

std::unordered_map<int, string> FeatureVocabulary::id_to_name() const {
  std::unordered_map<int, string> mapping;
  for (const auto &entry : entries_) mapping[entry.second] = entry.first;
  return mapping;
}

}  // namespace nlp
}  // namespace semview
