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

#ifndef SEMVIEW_NLP_VIEWS_FEATURE_VOCABULARY_H_
#define SEMVIEW_NLP_VIEWS_FEATURE_VOCABULARY_H_

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "semview/base/types.h"

namespace semview {
namespace nlp {

// Vocabulary mapping feature label names to ids. The ids of the labels form a
// contiguous range starting at the vocabulary offset. Several vocabularies can
// share one id space by rebasing them to non-overlapping offsets.
//
// The vocabulary is only mutated by Build() and Rebase(). These must not run
// concurrently with readers; rebase vocabularies during setup before starting
// extraction on multiple threads.
class FeatureVocabulary {
 public:
  // Initializes vocabulary with size labels named C00, C01, ... with ids
  // assigned consecutively starting at offset.
  void Build(int size, int offset);

  // Shifts all ids so the first label gets the id new_offset, i.e. each id
  // becomes id - offset + new_offset. Rebasing twice to the same offset is
  // the same as rebasing once.
  void Rebase(int new_offset);

  // Returns the label name for a label index, e.g. C03 for index 3.
  static string LabelName(int index);

  // Looks up id for label name. Returns -1 if the label is not found.
  int Lookup(const string &name) const;

  // Returns the id of the label with the given index.
  int id(int index) const { return entries_[index].second; }

  // Returns the name of the label with the given index.
  const string &name(int index) const { return entries_[index].first; }

  // Returns mapping from label names to ids.
  std::unordered_map<string, int> name_to_id() const;

  // Returns mapping from ids to label names. The mapping is only well-defined
  // when ids are unique, which holds for a single vocabulary but is the
  // caller's responsibility when vocabularies are combined.
  std::unordered_map<int, string> id_to_name() const;

  // Returns label entries in label order.
  const std::vector<std::pair<string, int>> &entries() const {
    return entries_;
  }

  // Returns the id of the first label.
  int offset() const { return offset_; }

  // Returns the number of labels.
  int size() const { return entries_.size(); }

 private:
  // Label names and ids in label order.
  std::vector<std::pair<string, int>> entries_;

  // Current offset of the label ids.
  int offset_ = 0;
};

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_VIEWS_FEATURE_VOCABULARY_H_
