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
#include <string>
#include <vector>

#include "semview/base/flags.h"
#include "semview/base/init.h"
#include "semview/base/logging.h"
#include "semview/base/status.h"
#include "semview/base/types.h"
#include "semview/file/file.h"
#include "semview/nlp/document/document-reader.h"
#include "semview/nlp/document/document.h"
#include "semview/nlp/views/extractor-params.h"
#include "semview/nlp/views/token-feature-extractor.h"
#include "semview/nlp/views/view-stacking.h"
#include "semview/util/threadpool.h"

DEFINE_string(documents, "", "Input file with one JSON document per line");
DEFINE_string(extractor, "coref_feats_flat_views", "Feature extractor type");
DEFINE_int32(max_views, 1, "Maximum number of views per document");
DEFINE_int32(max_coref_clusters, 10, "Maximum number of labeled clusters");
DEFINE_int32(labels_start_id, 1, "First label id");
DEFINE_bool(pad_views, false, "Repeat views up to max_views");
DEFINE_int32(views_axis, 0, "Axis for views in output tensors (0 or 1)");
DEFINE_bool(use_mask, false, "Use features as mask");
DEFINE_int32(vocab_offset, -1, "Rebase vocabulary to offset if not negative");
DEFINE_int32(threads, 4, "Number of extraction threads");
DEFINE_bool(print_vocab, false, "Output label vocabulary");

using namespace semview;
using namespace semview::nlp;

// Extraction result for one input line.
struct Result {
  Status status;
  ViewBatch batch;
};

// Parses document and extracts views.
void ProcessDocument(const TokenFeatureExtractor *extractor,
                     const string &text, Result *result) {
  ParsedDocument document;
  result->status = DocumentReader::Parse(text, &document);
  if (!result->status.ok()) return;
  result->status = extractor->Extract(document, &result->batch);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv,
              "Extract token feature views from JSON documents.\n\n"
              "Usage: extract-views --documents=<file> [OPTIONS]\n");
  if (FLAGS_documents.empty()) {
    std::cerr << argv[0] << " --documents=<file> [OPTIONS]\n";
    return 1;
  }
  if (FLAGS_threads < 1) {
    LOG(ERROR) << "--threads must be positive";
    return 1;
  }

  // Create feature extractor.
  ExtractorParams params;
  params.Add("max_views", FLAGS_max_views);
  params.Add("max_coref_clusters", FLAGS_max_coref_clusters);
  params.Add("labels_start_id", FLAGS_labels_start_id);
  params.Add("pad_views", FLAGS_pad_views);
  params.Add("views_axis", FLAGS_views_axis);
  params.Add("use_mask", FLAGS_use_mask);
  TokenFeatureExtractor *extractor = nullptr;
  Status st = CreateTokenFeatureExtractor(FLAGS_extractor, params, &extractor);
  if (!st.ok()) {
    LOG(ERROR) << "Cannot create extractor: " << st;
    return 1;
  }

  // The vocabulary must be rebased before extraction starts.
  if (FLAGS_vocab_offset >= 0) {
    int next = RebaseVocabularies({extractor}, FLAGS_vocab_offset);
    VLOG(1) << "Vocabulary ids " << FLAGS_vocab_offset << " to " << next - 1;
  }
  if (FLAGS_print_vocab) {
    for (const auto &entry : extractor->vocabulary().entries()) {
      std::cout << extractor->namespace_name() << "/" << entry.first << "\t"
                << entry.second << "\n";
    }
  }

  // Read documents.
  std::vector<string> lines;
  st = File::ReadLines(FLAGS_documents, &lines);
  if (!st.ok()) {
    LOG(ERROR) << st;
    delete extractor;
    return 1;
  }

  // Extract views in parallel. The pool is destroyed at the end of the scope,
  // which waits for all scheduled documents.
  int num_lines = lines.size();
  std::vector<Result> results(num_lines);
  {
    ThreadPool pool(FLAGS_threads, 1024);
    pool.StartWorkers();
    for (int i = 0; i < num_lines; ++i) {
      if (lines[i].empty()) continue;
      const string *text = &lines[i];
      Result *result = &results[i];
      pool.Schedule([extractor, text, result]() {
        ProcessDocument(extractor, *text, result);
      });
    }
  }

  // Output results in input order.
  int extracted = 0;
  int failures = 0;
  for (int i = 0; i < num_lines; ++i) {
    if (lines[i].empty()) continue;
    const Result &result = results[i];
    if (result.status.ok()) {
      std::cout << (i + 1) << "\tfeatures=" << result.batch.features
                << "\tmask=" << result.batch.mask << "\n";
      extracted++;
    } else {
      LOG(ERROR) << FLAGS_documents << ":" << (i + 1) << ": " << result.status;
      std::cout << (i + 1) << "\terror=" << result.status << "\n";
      failures++;
    }
  }
  LOG(INFO) << extracted << " documents extracted, "
            << failures << " failed";

  delete extractor;
  return failures > 0 ? 1 : 0;
}
