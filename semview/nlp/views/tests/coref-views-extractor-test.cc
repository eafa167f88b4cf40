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

#include "semview/base/init.h"
#include "semview/base/logging.h"
#include "semview/base/status.h"
#include "semview/nlp/document/document-reader.h"
#include "semview/nlp/document/document.h"
#include "semview/nlp/views/extractor-params.h"
#include "semview/nlp/views/tensor.h"
#include "semview/nlp/views/token-feature-extractor.h"
#include "semview/nlp/views/view-stacking.h"

using namespace semview;
using namespace semview::nlp;

const char *kExtractor = "coref_feats_flat_views";

// Two sentences with three tokens each and one mention of tokens 1 and 2.
const char *kSimpleDocument =
    "{\"sentences\": [{\"tokens\": [\"John\", \"saw\", \"Mary\"]},"
    "                 {\"tokens\": [\"He\", \"waved\", \".\"]}],"
    " \"coreference_clusters\": [{\"mentions\": [{\"start\": 1, \"end\": 3}]}]}";

ExtractorParams DefaultParams(int max_views, int max_clusters) {
  ExtractorParams params;
  params.Add("max_views", max_views);
  params.Add("max_coref_clusters", max_clusters);
  return params;
}

TokenFeatureExtractor *NewExtractor(const ExtractorParams &params) {
  TokenFeatureExtractor *extractor = nullptr;
  CHECK(CreateTokenFeatureExtractor(kExtractor, params, &extractor));
  CHECK(extractor != nullptr);
  return extractor;
}

ParsedDocument ReadDocument(const string &json) {
  ParsedDocument document;
  CHECK(DocumentReader::Parse(json, &document));
  return document;
}

// Builds a document with one sentence of the given length.
ParsedDocument MakeDocument(int num_tokens) {
  ParsedDocument document;
  Sentence *sentence = document.AddSentence();
  sentence->set_has_tokens(true);
  for (int i = 0; i < num_tokens; ++i) sentence->AddToken("w");
  return document;
}

// Adds cluster with single-token mentions.
void AddCluster(ParsedDocument *document, const std::vector<int> &tokens) {
  CoreferenceCluster *cluster = document->AddCluster();
  cluster->set_has_mentions(true);
  for (int t : tokens) cluster->AddMention(t, t + 1);
}

void TestEndToEnd() {
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  CHECK_EQ(extractor->namespace_name(), "coref_feats");
  CHECK_EQ(extractor->max_views(), 1);

  ViewBatch batch;
  CHECK(extractor->Extract(ReadDocument(kSimpleDocument), &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{0, 2, 2, 0, 0, 0}}));
  CHECK_EQ(batch.mask, Tensor::FromRows({{1, 1, 1, 1, 1, 1}}));
  delete extractor;
}

void TestNoClusters() {
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  const char *documents[] = {
    "{\"sentences\": [{\"tokens\": [\"a\", \"b\"]}, {\"tokens\": [\"c\"]}]}",
    "{\"sentences\": [{\"tokens\": [\"a\", \"b\", \"c\"]}],"
    " \"coreference_clusters\": []}",
  };
  for (const char *json : documents) {
    ViewBatch batch;
    CHECK(extractor->Extract(ReadDocument(json), &batch));
    CHECK_EQ(batch.features, Tensor(Shape({1, 3}), 0));
    CHECK_EQ(batch.mask, Tensor(Shape({1, 3}), 1));
  }

  // Empty document.
  ViewBatch batch;
  CHECK(extractor->Extract(ReadDocument("{\"sentences\": []}"), &batch));
  CHECK_EQ(batch.features.shape(), Shape({1, 0}));
  CHECK_EQ(batch.mask.shape(), Shape({1, 0}));
  delete extractor;
}

void TestShapes() {
  ParsedDocument document = ReadDocument(kSimpleDocument);
  for (int max_views = 1; max_views <= 4; ++max_views) {
    for (int pad = 0; pad < 2; ++pad) {
      for (int axis = 0; axis < 2; ++axis) {
        for (int use_mask = 0; use_mask < 2; ++use_mask) {
          ExtractorParams params = DefaultParams(max_views, 5);
          params.Add("pad_views", pad == 1);
          params.Add("views_axis", axis);
          params.Add("use_mask", use_mask == 1);
          TokenFeatureExtractor *extractor = NewExtractor(params);

          ViewBatch batch;
          CHECK(extractor->Extract(document, &batch));
          CHECK_EQ(batch.features.shape(), batch.mask.shape());
          CHECK_EQ(batch.features.dim(axis), pad ? max_views : 1);
          CHECK_EQ(batch.features.dim(1 - axis), 6);
          if (use_mask) CHECK_EQ(batch.mask, batch.features);
          delete extractor;
        }
      }
    }
  }
}

void TestPadding() {
  ExtractorParams params = DefaultParams(4, 5);
  params.Add("pad_views", true);
  TokenFeatureExtractor *extractor = NewExtractor(params);

  ViewBatch batch;
  CHECK(extractor->Extract(ReadDocument(kSimpleDocument), &batch));
  CHECK_EQ(batch.features.shape(), Shape({4, 6}));
  std::vector<int32> expected = {0, 2, 2, 0, 0, 0};
  for (int k = 0; k < 4; ++k) {
    CHECK(batch.features.Slice(0, k) == expected);
    CHECK(batch.mask.Slice(0, k) == std::vector<int32>(6, 1));
  }
  delete extractor;
}

void TestClusterSelection() {
  // Clusters with 3, 1, 2, and 1 mentions. With room for two clusters the
  // two single-mention clusters are kept in cluster order.
  ParsedDocument document = MakeDocument(8);
  AddCluster(&document, {0, 1, 2});
  AddCluster(&document, {3});
  AddCluster(&document, {4, 5});
  AddCluster(&document, {6});

  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 2));
  ViewBatch batch;
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{0, 0, 0, 2, 0, 0, 3, 0}}));
  delete extractor;

  // With room for all clusters they are labeled in cluster order.
  extractor = NewExtractor(DefaultParams(1, 4));
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{2, 2, 2, 3, 4, 4, 5, 0}}));
  delete extractor;

  // No clusters are labeled when the cap is zero.
  extractor = NewExtractor(DefaultParams(1, 0));
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features, Tensor(Shape({1, 8}), 0));
  delete extractor;
}

void TestOverlap() {
  ParsedDocument document = ReadDocument(
      "{\"sentences\": [{\"tokens\": [0, 1, 2, 3, 4, 5, 6, 7]}],"
      " \"coreference_clusters\": ["
      "   {\"mentions\": [{\"start\": 4, \"end\": 6}]},"
      "   {\"mentions\": [{\"start\": 5, \"end\": 7}]}]}");
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  ViewBatch batch;
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features.at(0, 4), 2);
  CHECK_EQ(batch.features.at(0, 5), 3);
  CHECK_EQ(batch.features.at(0, 6), 3);
  delete extractor;

  // When the cap reorders the clusters, overlaps are resolved in selection
  // order. Cluster 0 has two mentions and comes after the single-mention
  // cluster 1, so cluster 0 labels token 5 even though it is first in the
  // input.
  ParsedDocument reordered = MakeDocument(8);
  AddCluster(&reordered, {5, 0});
  AddCluster(&reordered, {5});
  AddCluster(&reordered, {1, 2, 3});
  extractor = NewExtractor(DefaultParams(1, 2));
  CHECK(extractor->Extract(reordered, &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{3, 0, 0, 0, 0, 3, 0, 0}}));
  delete extractor;
}

void TestMissingMentions() {
  // A cluster without mentions keeps its label slot. Empty mentions label
  // nothing.
  ParsedDocument document = ReadDocument(
      "{\"sentences\": [{\"tokens\": [\"a\", \"b\", \"c\", \"d\"]}],"
      " \"coref_clusters\": ["
      "   {\"id\": 7},"
      "   {\"mentions\": [{\"start\": 1, \"end\": 2},"
      "                   {\"start\": 3, \"end\": 3}]}]}");
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  ViewBatch batch;
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{0, 3, 0, 0}}));
  delete extractor;
}

void TestRebase() {
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  ParsedDocument document = ReadDocument(kSimpleDocument);

  extractor->RebaseVocabulary(10);
  auto once = extractor->vocabulary().name_to_id();
  extractor->RebaseVocabulary(10);
  CHECK(extractor->vocabulary().name_to_id() == once);
  CHECK_EQ(extractor->vocabulary().Lookup("C00"), 10);

  ViewBatch batch;
  CHECK(extractor->Extract(document, &batch));
  CHECK_EQ(batch.features, Tensor::FromRows({{0, 11, 11, 0, 0, 0}}));

  // Lay out two vocabularies back to back.
  TokenFeatureExtractor *other = NewExtractor(DefaultParams(1, 3));
  int next = RebaseVocabularies({extractor, other}, 1);
  CHECK_EQ(next, 9);
  CHECK_EQ(extractor->vocabulary().offset(), 1);
  CHECK_EQ(other->vocabulary().offset(), 6);
  CHECK_EQ(other->vocabulary().Lookup("C02"), 8);
  delete other;
  delete extractor;
}

void TestDocumentErrors() {
  TokenFeatureExtractor *extractor = NewExtractor(DefaultParams(1, 5));
  ViewBatch batch;

  Status st = extractor->Extract(ReadDocument("{\"text\": \"hi\"}"), &batch);
  CHECK_EQ(st.code(), MISSING_FIELD);

  st = extractor->Extract(
      ReadDocument("{\"sentences\": [{\"tokens\": [\"a\"]}, {}]}"), &batch);
  CHECK_EQ(st.code(), MISSING_FIELD);

  st = extractor->Extract(ReadDocument(
      "{\"sentences\": [{\"tokens\": [\"a\", \"b\"]}],"
      " \"coreference_clusters\": ["
      "   {\"mentions\": [{\"start\": 1, \"end\": 3}]}]}"), &batch);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);

  st = extractor->Extract(ReadDocument(
      "{\"sentences\": [{\"tokens\": [\"a\", \"b\"]}],"
      " \"coreference_clusters\": ["
      "   {\"mentions\": [{\"start\": -1, \"end\": 1}]}]}"), &batch);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);

  delete extractor;
}

void TestConfigurationErrors() {
  TokenFeatureExtractor *extractor = nullptr;

  ExtractorParams missing;
  missing.Add("max_views", 1);
  Status st = CreateTokenFeatureExtractor(kExtractor, missing, &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);
  CHECK(extractor == nullptr);

  st = CreateTokenFeatureExtractor(kExtractor, DefaultParams(0, 5), &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);

  st = CreateTokenFeatureExtractor(kExtractor, DefaultParams(1, -1),
                                   &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);

  ExtractorParams axis = DefaultParams(1, 5);
  axis.Add("views_axis", 2);
  st = CreateTokenFeatureExtractor(kExtractor, axis, &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);

  ExtractorParams number = DefaultParams(1, 5);
  number.Add("labels_start_id", "one");
  st = CreateTokenFeatureExtractor(kExtractor, number, &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);

  ExtractorParams flag = DefaultParams(1, 5);
  flag.Add("pad_views", "maybe");
  st = CreateTokenFeatureExtractor(kExtractor, flag, &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);

  ExtractorParams large = DefaultParams(1, 5);
  large.Add("labels_start_id", 2147483642);
  st = CreateTokenFeatureExtractor(kExtractor, large, &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);
  CHECK(extractor == nullptr);

  ExtractorParams largest = DefaultParams(1, 5);
  largest.Add("labels_start_id", 2147483641);
  st = CreateTokenFeatureExtractor(kExtractor, largest, &extractor);
  CHECK(st.ok());
  CHECK_EQ(extractor->vocabulary().id(4) + 1, 2147483646);
  delete extractor;
  extractor = nullptr;

  st = CreateTokenFeatureExtractor("srl_feats", DefaultParams(1, 5),
                                   &extractor);
  CHECK_EQ(st.code(), INVALID_CONFIGURATION);
  CHECK(extractor == nullptr);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestEndToEnd();
  TestNoClusters();
  TestShapes();
  TestPadding();
  TestClusterSelection();
  TestOverlap();
  TestMissingMentions();
  TestRebase();
  TestDocumentErrors();
  TestConfigurationErrors();

  std::cout << "PASS\n";
  return 0;
}
