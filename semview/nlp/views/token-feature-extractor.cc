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

#include "semview/nlp/views/token-feature-extractor.h"

#include "semview/base/logging.h"

REGISTER_COMPONENT_REGISTRY("token feature extractor",
                            semview::nlp::TokenFeatureExtractor);

namespace semview {
namespace nlp {

Status CreateTokenFeatureExtractor(const string &type,
                                   const ExtractorParams &params,
                                   TokenFeatureExtractor **extractor) {
  *extractor = nullptr;
  if (!TokenFeatureExtractor::Exists(type)) {
    return Status(INVALID_CONFIGURATION,
                  "Unknown token feature extractor", type);
  }

  TokenFeatureExtractor *e = TokenFeatureExtractor::Create(type);
  Status st = e->Init(params);
  if (!st.ok()) {
    delete e;
    return st;
  }

  VLOG(1) << "Created " << type << " extractor with " << e->max_views()
          << " views and " << e->vocabulary().size() << " labels";
  *extractor = e;
  return Status::OK;
}

int RebaseVocabularies(const std::vector<TokenFeatureExtractor *> &extractors,
                       int start) {
  int next = start;
  for (TokenFeatureExtractor *e : extractors) {
    e->RebaseVocabulary(next);
    next += e->vocabulary().size();
  }
  return next;
}

}  // namespace nlp
}  // namespace semview
