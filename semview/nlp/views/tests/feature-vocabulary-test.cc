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

#include <iostream>

#include "semview/base/init.h"
#include "semview/base/logging.h"
#include "semview/nlp/views/feature-vocabulary.h"

using namespace semview;
using namespace semview::nlp;

void TestBuild() {
  FeatureVocabulary vocab;
  vocab.Build(12, 1);
  CHECK_EQ(vocab.size(), 12);
  CHECK_EQ(vocab.offset(), 1);
  CHECK_EQ(vocab.name(0), "C00");
  CHECK_EQ(vocab.name(11), "C11");
  CHECK_EQ(vocab.Lookup("C00"), 1);
  CHECK_EQ(vocab.Lookup("C03"), 4);
  CHECK_EQ(vocab.Lookup("C12"), -1);
  CHECK_EQ(FeatureVocabulary::LabelName(123), "C123");

  auto forward = vocab.name_to_id();
  auto inverse = vocab.id_to_name();
  CHECK_EQ(forward.size(), 12);
  CHECK_EQ(inverse.size(), 12);
  for (const auto &it : forward) CHECK_EQ(inverse[it.second], it.first);
}

void TestRebase() {
  FeatureVocabulary vocab;
  vocab.Build(5, 1);
  vocab.Rebase(20);
  CHECK_EQ(vocab.offset(), 20);
  CHECK_EQ(vocab.Lookup("C00"), 20);
  CHECK_EQ(vocab.Lookup("C04"), 24);
  auto once = vocab.name_to_id();

  // Rebasing again to the same offset does not change the ids.
  vocab.Rebase(20);
  CHECK(vocab.name_to_id() == once);

  vocab.Rebase(1);
  CHECK_EQ(vocab.Lookup("C00"), 1);
  CHECK_EQ(vocab.id(4), 5);
}

void TestEmpty() {
  FeatureVocabulary vocab;
  vocab.Build(0, 3);
  CHECK_EQ(vocab.size(), 0);
  vocab.Rebase(7);
  CHECK_EQ(vocab.offset(), 7);
  CHECK(vocab.id_to_name().empty());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestBuild();
  TestRebase();
  TestEmpty();

  std::cout << "PASS\n";
  return 0;
}
