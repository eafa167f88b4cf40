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

#ifndef SEMVIEW_NLP_VIEWS_TOKEN_FEATURE_EXTRACTOR_H_
#define SEMVIEW_NLP_VIEWS_TOKEN_FEATURE_EXTRACTOR_H_

#include <string>
#include <vector>

#include "semview/base/registry.h"
#include "semview/base/status.h"
#include "semview/base/types.h"
#include "semview/nlp/document/document.h"
#include "semview/nlp/views/extractor-params.h"
#include "semview/nlp/views/feature-vocabulary.h"
#include "semview/nlp/views/view-stacking.h"

namespace semview {
namespace nlp {

// Token-wise interaction feature extractor interface. An extractor turns the
// annotations of a parsed document into a batch of per-token feature views
// with a mask of the same shape. Each extractor owns a vocabulary of the
// feature labels it emits.
//
// Extraction does not modify the extractor, so one extractor can be used from
// several threads at the same time. The vocabulary must only be rebased while
// no extraction is running.
class TokenFeatureExtractor : public Component<TokenFeatureExtractor> {
 public:
  virtual ~TokenFeatureExtractor() = default;

  // Initializes extractor from parameters. Invalid parameters are reported as
  // INVALID_CONFIGURATION errors.
  virtual Status Init(const ExtractorParams &params) = 0;

  // Extracts feature views for document.
  virtual Status Extract(const ParsedDocument &document,
                         ViewBatch *batch) const = 0;

  // Shifts the ids of the extractor vocabulary to start at offset.
  virtual void RebaseVocabulary(int offset) { vocabulary_.Rebase(offset); }

  // Returns the feature label vocabulary.
  const FeatureVocabulary &vocabulary() const { return vocabulary_; }

  // Returns the maximum number of views emitted per document.
  int max_views() const { return max_views_; }

  // Returns the namespace tag for the vocabulary.
  const string &namespace_name() const { return namespace_; }

 protected:
  // Feature label vocabulary.
  FeatureVocabulary vocabulary_;

  // Maximum number of views.
  int max_views_ = 1;

  // Vocabulary namespace.
  string namespace_;
};

#define REGISTER_TOKEN_FEATURE_EXTRACTOR(type, component) \
    REGISTER_COMPONENT_TYPE(semview::nlp::TokenFeatureExtractor, type, component)

// Creates and initializes a token feature extractor by registered type name.
// Unknown types and initialization errors are returned as status, in which
// case no extractor is returned. The caller takes ownership of the extractor.
Status CreateTokenFeatureExtractor(const string &type,
                                   const ExtractorParams &params,
                                   TokenFeatureExtractor **extractor);

// Lays out the vocabularies of the extractors back to back in one id space
// starting at start. Returns the first id after the last vocabulary.
int RebaseVocabularies(const std::vector<TokenFeatureExtractor *> &extractors,
                       int start);

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_VIEWS_TOKEN_FEATURE_EXTRACTOR_H_
