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

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

#include "semview/base/logging.h"
#include "semview/base/status.h"
#include "semview/nlp/document/document.h"
#include "semview/nlp/views/tensor.h"
#include "semview/nlp/views/token-feature-extractor.h"
#include "semview/nlp/views/view-stacking.h"

namespace semview {
namespace nlp {

// Coreference view extractor. Every token is labeled with the coreference
// cluster it belongs to, giving a single view where 0 means that the token is
// not part of any selected cluster. Cluster k in selection order is labeled
// with the id of vocabulary entry k plus one.
class CorefViewsExtractor : public TokenFeatureExtractor {
 public:
  Status Init(const ExtractorParams &params) override {
    Status st = params.GetRequired("max_views", &max_views_);
    if (!st.ok()) return st;
    st = params.GetRequired("max_coref_clusters", &max_clusters_);
    if (!st.ok()) return st;
    int labels_start_id;
    st = params.Get("labels_start_id", 1, &labels_start_id);
    if (!st.ok()) return st;
    st = params.Get("namespace", string("coref_feats"), &namespace_);
    if (!st.ok()) return st;
    st = params.Get("pad_views", false, &options_.pad_views);
    if (!st.ok()) return st;
    st = params.Get("views_axis", 0, &options_.views_axis);
    if (!st.ok()) return st;
    st = params.Get("use_mask", false, &options_.use_mask);
    if (!st.ok()) return st;

    if (max_views_ < 1) {
      return Status(INVALID_CONFIGURATION, "max_views must be positive");
    }
    if (max_clusters_ < 0) {
      return Status(INVALID_CONFIGURATION,
                    "max_coref_clusters must not be negative");
    }
    if (labels_start_id < 0) {
      return Status(INVALID_CONFIGURATION,
                    "labels_start_id must not be negative");
    }
    if (labels_start_id > std::numeric_limits<int>::max() - max_clusters_ - 1) {
      return Status(INVALID_CONFIGURATION,
                    "labels_start_id is too large for max_coref_clusters");
    }
    if (options_.views_axis != 0 && options_.views_axis != 1) {
      return Status(INVALID_CONFIGURATION, "views_axis must be 0 or 1");
    }
    options_.max_views = max_views_;

    vocabulary_.Build(max_clusters_, labels_start_id);
    return Status::OK;
  }

  Status Extract(const ParsedDocument &document,
                 ViewBatch *batch) const override {
    // Compute the size of the flattened token sequence.
    if (!document.has_sentences()) {
      return Status(MISSING_FIELD, "Document is missing field 'sentences'");
    }
    for (int i = 0; i < document.num_sentences(); ++i) {
      if (!document.sentence(i).has_tokens()) {
        return Status(MISSING_FIELD, "Sentence " + std::to_string(i) +
                      " is missing field 'tokens'");
      }
    }
    int num_tokens = document.num_tokens();

    Tensor view(Shape({num_tokens}));
    Tensor mask(Shape({num_tokens}), 1);

    // Label the mentions of the selected clusters. Later clusters overwrite
    // the labels of earlier clusters for overlapping mentions.
    std::vector<int> selected = SelectClusters(document);
    for (int pos = 0; pos < static_cast<int>(selected.size()); ++pos) {
      int label = vocabulary_.id(pos) + 1;
      const CoreferenceCluster &cluster = document.cluster(selected[pos]);
      for (const Mention &mention : cluster.mentions()) {
        if (mention.begin() >= mention.end()) continue;
        if (mention.begin() < 0 || mention.end() > num_tokens) {
          return Status(INVALID_ARGUMENT,
                        "Mention [" + std::to_string(mention.begin()) + ", " +
                        std::to_string(mention.end()) + ") in cluster " +
                        std::to_string(selected[pos]) +
                        " is outside the document with " +
                        std::to_string(num_tokens) + " tokens");
        }
        for (int t = mention.begin(); t < mention.end(); ++t) {
          view.at(t) = label;
        }
      }
    }

    std::vector<Tensor> views = TrimViews({view}, max_views_);
    StackViews(views, mask, options_, batch);
    return Status::OK;
  }

 private:
  // Returns the indices of the clusters to label in labeling order. If there
  // are more clusters than labels, the clusters with the fewest mentions are
  // selected with ties broken by cluster order.
  std::vector<int> SelectClusters(const ParsedDocument &document) const {
    int num_clusters = document.num_clusters();
    std::vector<int> order(num_clusters);
    std::iota(order.begin(), order.end(), 0);
    if (num_clusters <= max_clusters_) return order;

    std::stable_sort(order.begin(), order.end(), [&document](int a, int b) {
      return document.cluster(a).num_mentions() <
             document.cluster(b).num_mentions();
    });
    order.resize(max_clusters_);
    VLOG(2) << "Selected " << max_clusters_ << " of " << num_clusters
            << " coreference clusters";
    return order;
  }

  // Maximum number of clusters labeled per document.
  int max_clusters_ = 0;

  // Options for stacking the views.
  ViewStackingOptions options_;
};

REGISTER_TOKEN_FEATURE_EXTRACTOR("coref_feats_flat_views", CorefViewsExtractor);

}  // namespace nlp
}  // namespace semview
