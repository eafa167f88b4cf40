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

#include "semview/nlp/views/view-stacking.h"

#include <algorithm>
#include <numeric>

#include "semview/base/logging.h"

namespace semview {
namespace nlp {

std::vector<Tensor> TrimViews(const std::vector<Tensor> &views,
                              int max_views) {
  CHECK_GE(max_views, 0);
  if (static_cast<int>(views.size()) <= max_views) return views;
  return std::vector<Tensor>(views.begin(), views.begin() + max_views);
}

std::vector<Tensor> TrimViews(const std::vector<Tensor> &views, int max_views,
                              const std::vector<int> &ranks) {
  CHECK_GE(max_views, 0);
  CHECK_EQ(views.size(), ranks.size());
  if (static_cast<int>(views.size()) <= max_views) return views;

  std::vector<int> order(views.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&ranks](int a, int b) {
    return ranks[a] < ranks[b];
  });

  std::vector<Tensor> selected;
  for (int i = 0; i < max_views; ++i) selected.push_back(views[order[i]]);
  return selected;
}

void StackViews(const std::vector<Tensor> &views, const Tensor &mask,
                const ViewStackingOptions &options, ViewBatch *batch) {
  int axis = options.views_axis;
  CHECK(axis == 0 || axis == 1) << "Invalid views axis: " << axis;
  CHECK_GE(options.max_views, 1);
  CHECK(!views.empty());
  CHECK_LE(views.size(), options.max_views);
  CHECK_EQ(mask.rank(), 1);
  for (const Tensor &view : views) {
    CHECK_EQ(view.shape(), mask.shape());
  }

  // Insert views axis and align the mask with the views.
  int num_views = views.size();
  if (num_views > 1) {
    std::vector<Tensor> expanded;
    expanded.reserve(num_views);
    for (const Tensor &view : views) expanded.push_back(view.ExpandDims(axis));
    batch->features = Tensor::Concat(expanded, axis);
    batch->mask = mask.ExpandDims(axis).Repeat(axis, num_views);
  } else {
    batch->features = views[0].ExpandDims(axis);
    batch->mask = mask.ExpandDims(axis);
  }

  // Tile features and mask up to the requested number of views.
  if (options.pad_views && num_views < options.max_views) {
    batch->features = batch->features.Repeat(axis, options.max_views);
    batch->mask = batch->mask.Repeat(axis, options.max_views);
  }

  if (options.use_mask) batch->mask = batch->features;

  CHECK_EQ(batch->features.shape(), batch->mask.shape())
      << "Feature and mask shapes must be the same";
  VLOG(3) << "Stacked " << num_views << " views into "
          << batch->features.shape();
}

}  // namespace nlp
}  // namespace semview
