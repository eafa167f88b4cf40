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

#ifndef SEMVIEW_NLP_VIEWS_VIEW_STACKING_H_
#define SEMVIEW_NLP_VIEWS_VIEW_STACKING_H_

#include <vector>

#include "semview/base/types.h"
#include "semview/nlp/views/tensor.h"

namespace semview {
namespace nlp {

// Options for stacking views into a view batch.
struct ViewStackingOptions {
  // Number of views that the batch is padded to.
  int max_views = 1;

  // Repeat the views until there are max_views views.
  bool pad_views = false;

  // Axis of the views dimension. The views are rows for axis 0 and columns
  // for axis 1.
  int views_axis = 0;

  // Use the features as the mask.
  bool use_mask = false;
};

// Feature views for a document together with the alignment mask. The feature
// and mask tensors always have the same shape, [views x tokens] for views
// axis 0 and [tokens x views] for views axis 1.
struct ViewBatch {
  Tensor features;
  Tensor mask;
};

// Selects at most max_views views. Views are returned unchanged if they
// already fit, otherwise the first max_views views are kept. No padding is
// done here.
std::vector<Tensor> TrimViews(const std::vector<Tensor> &views, int max_views);

// Selects at most max_views views ranked by ascending rank with ties broken by
// input order. The selected views are returned in rank order. There must be
// one rank per view.
std::vector<Tensor> TrimViews(const std::vector<Tensor> &views, int max_views,
                              const std::vector<int> &ranks);

// Stacks rank 1 views of per-token labels into a view batch. The mask is a
// rank 1 tensor with one value per token which is broadcast to every view.
// There must be at least one and at most max_views views, all with the same
// length as the mask.
void StackViews(const std::vector<Tensor> &views, const Tensor &mask,
                const ViewStackingOptions &options, ViewBatch *batch);

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_VIEWS_VIEW_STACKING_H_
