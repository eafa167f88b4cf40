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
#include <vector>

#include "semview/base/init.h"
#include "semview/base/logging.h"
#include "semview/nlp/views/tensor.h"
#include "semview/nlp/views/view-stacking.h"

using namespace semview;
using namespace semview::nlp;

void TestTrim() {
  std::vector<Tensor> views = {
    Tensor::FromVector({1, 1}),
    Tensor::FromVector({2, 2}),
    Tensor::FromVector({3, 3}),
  };

  // Views that fit are returned unchanged and never padded.
  CHECK_EQ(TrimViews(views, 3).size(), 3);
  CHECK_EQ(TrimViews(views, 5).size(), 3);

  std::vector<Tensor> first = TrimViews(views, 2);
  CHECK_EQ(first.size(), 2);
  CHECK_EQ(first[0], views[0]);
  CHECK_EQ(first[1], views[1]);

  // Ranked trimming keeps the lowest ranks with ties in input order.
  std::vector<Tensor> ranked = TrimViews(views, 2, {5, 1, 1});
  CHECK_EQ(ranked.size(), 2);
  CHECK_EQ(ranked[0], views[1]);
  CHECK_EQ(ranked[1], views[2]);
}

void TestSingleView() {
  Tensor view = Tensor::FromVector({0, 2, 2, 0});
  Tensor mask = Tensor::FromVector({1, 1, 1, 1});

  ViewStackingOptions options;
  ViewBatch batch;
  StackViews({view}, mask, options, &batch);
  CHECK_EQ(batch.features, Tensor::FromRows({{0, 2, 2, 0}}));
  CHECK_EQ(batch.mask, Tensor::FromRows({{1, 1, 1, 1}}));

  options.views_axis = 1;
  StackViews({view}, mask, options, &batch);
  CHECK_EQ(batch.features.shape(), Shape({4, 1}));
  CHECK_EQ(batch.mask.shape(), Shape({4, 1}));
  CHECK_EQ(batch.features.Transposed(), Tensor::FromRows({{0, 2, 2, 0}}));
}

void TestMultipleViews() {
  std::vector<Tensor> views = {
    Tensor::FromVector({1, 0, 1}),
    Tensor::FromVector({0, 2, 0}),
  };
  Tensor mask = Tensor::FromVector({1, 1, 0});

  ViewStackingOptions options;
  options.max_views = 2;
  ViewBatch batch;
  StackViews(views, mask, options, &batch);
  CHECK_EQ(batch.features, Tensor::FromRows({{1, 0, 1}, {0, 2, 0}}));
  CHECK_EQ(batch.mask, Tensor::FromRows({{1, 1, 0}, {1, 1, 0}}));

  options.views_axis = 1;
  StackViews(views, mask, options, &batch);
  CHECK_EQ(batch.features, Tensor::FromRows({{1, 0}, {0, 2}, {1, 0}}));
  CHECK_EQ(batch.mask, Tensor::FromRows({{1, 1}, {1, 1}, {0, 0}}));
}

void TestPadding() {
  Tensor view = Tensor::FromVector({0, 3, 0});
  Tensor mask = Tensor::FromVector({1, 1, 1});

  for (int axis = 0; axis < 2; ++axis) {
    ViewStackingOptions options;
    options.max_views = 4;
    options.pad_views = true;
    options.views_axis = axis;
    ViewBatch batch;
    StackViews({view}, mask, options, &batch);
    CHECK_EQ(batch.features.dim(axis), 4);
    CHECK_EQ(batch.features.shape(), batch.mask.shape());
    for (int k = 0; k < 4; ++k) {
      CHECK(batch.features.Slice(axis, k) == view.values());
      CHECK(batch.mask.Slice(axis, k) == mask.values());
    }
  }

  // Without padding the view count stays at the natural count.
  ViewStackingOptions options;
  options.max_views = 4;
  ViewBatch batch;
  StackViews({view}, mask, options, &batch);
  CHECK_EQ(batch.features.shape(), Shape({1, 3}));
}

void TestUseMask() {
  Tensor view = Tensor::FromVector({0, 5, 5});
  Tensor mask = Tensor::FromVector({1, 1, 1});

  ViewStackingOptions options;
  options.max_views = 3;
  options.pad_views = true;
  options.use_mask = true;
  ViewBatch batch;
  StackViews({view}, mask, options, &batch);
  CHECK_EQ(batch.features.shape(), Shape({3, 3}));
  CHECK_EQ(batch.mask, batch.features);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestTrim();
  TestSingleView();
  TestMultipleViews();
  TestPadding();
  TestUseMask();

  std::cout << "PASS\n";
  return 0;
}
