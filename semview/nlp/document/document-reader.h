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

#ifndef SEMVIEW_NLP_DOCUMENT_DOCUMENT_READER_H_
#define SEMVIEW_NLP_DOCUMENT_DOCUMENT_READER_H_

#include <string>

#include "semview/base/macros.h"
#include "semview/base/status.h"
#include "semview/nlp/document/document.h"
#include "semview/util/json-scanner.h"

namespace semview {
namespace nlp {

// The document reader parses a JSON parse of a document into a parsed document:
//
//   {
//     "sentences": [{"tokens": ["John", "saw", "him", "."]}, ...],
//     "coreference_clusters": [
//       {"mentions": [{"start": 0, "end": 1}, {"start": 2, "end": 3}]}, ...
//     ]
//   }
//
// The cluster list is also accepted under the key "coref_clusters". All other
// fields are skipped. Missing sentence, token, and mention lists are recorded
// in the document and are not errors here; feature extractors decide which
// fields they require. A mention without "start" or "end" is a MISSING_FIELD
// error.
class DocumentReader {
 public:
  // Parses JSON text into document.
  static Status Parse(const string &text, ParsedDocument *document);

 private:
  DocumentReader(const string &text, ParsedDocument *document)
      : scanner_(text), document_(document) {}

  // Parses the top-level document object.
  void ParseDocument();

  // Parses list of sentences.
  void ParseSentences();

  // Parses sentence object.
  void ParseSentence(Sentence *sentence);

  // Parses list of tokens for sentence.
  void ParseTokens(Sentence *sentence);

  // Parses list of coreference clusters.
  void ParseClusters();

  // Parses coreference cluster object.
  void ParseCluster(CoreferenceCluster *cluster);

  // Parses list of mentions for cluster.
  void ParseMentions(CoreferenceCluster *cluster);

  // Parses mention object and adds it to the cluster.
  void ParseMention(CoreferenceCluster *cluster);

  // Parses integer value.
  bool ParseInteger(const string &field, int *value);

  // Skips over the next value. Values nested deeper than kMaxNesting are
  // syntax errors.
  void SkipValue();

  // Skips over the object or array at the current token.
  void SkipContainer();

  // Parses an object key and the colon after it. Returns false on error.
  bool ParseKey(string *key);

  // Consumes the expected token. Records a syntax error if the current token
  // is different.
  bool Expect(int token);

  // Skips comma between elements. Returns false if the object or array is not
  // properly continued or closed, or if a comma is followed by close.
  bool SkipSeparator(int close);

  // Records error unless an error has already been recorded.
  void Fail(int code, const string &message);

  // Returns true if parsing should stop.
  bool failed() const { return !status_.ok() || scanner_.error(); }

  // Returns the final status of parsing.
  Status status() const;

  // Maximum nesting of skipped values.
  static const int kMaxNesting = 1000;

  JsonScanner scanner_;
  ParsedDocument *document_;
  Status status_;

  // Current nesting of skipped values.
  int depth_ = 0;

  DISALLOW_COPY_AND_ASSIGN(DocumentReader);
};

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_DOCUMENT_DOCUMENT_READER_H_
