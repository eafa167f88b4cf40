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

#include "semview/nlp/document/document.h"

#include "semview/base/logging.h"

namespace semview {
namespace nlp {

Sentence *ParsedDocument::AddSentence() {
  has_sentences_ = true;
  sentences_.emplace_back();
  return &sentences_.back();
}

CoreferenceCluster *ParsedDocument::AddCluster() {
  has_clusters_ = true;
  clusters_.emplace_back();
  return &clusters_.back();
}

void ParsedDocument::ClearClusters() {
  clusters_.clear();
}

int ParsedDocument::num_tokens() const {
  int count = 0;
  for (const Sentence &sentence : sentences_) count += sentence.length();
  return count;
}

int ParsedDocument::sentence_begin(int index) const {
  DCHECK_GE(index, 0);
  DCHECK_LE(index, num_sentences());
  int begin = 0;
  for (int i = 0; i < index; ++i) begin += sentences_[i].length();
  return begin;
}

}  // namespace nlp
}  // namespace semview
