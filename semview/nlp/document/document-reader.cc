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

#include "semview/nlp/document/document-reader.h"

#include <errno.h>
#include <stdlib.h>
#include <limits>
#include <string>

#include "semview/base/logging.h"

namespace semview {
namespace nlp {

Status DocumentReader::Parse(const string &text, ParsedDocument *document) {
  DocumentReader reader(text, document);
  reader.ParseDocument();
  Status st = reader.status();
  if (!st.ok()) VLOG(1) << "Error reading document: " << st;
  return st;
}

Status DocumentReader::status() const {
  if (scanner_.error()) {
    return Status(SYNTAX_ERROR, scanner_.GetErrorMessage());
  }
  return status_;
}

void DocumentReader::Fail(int code, const string &message) {
  if (!status_.ok()) return;
  if (code == SYNTAX_ERROR) {
    scanner_.SetError(message);
  } else {
    status_ = Status(code, message);
  }
}

bool DocumentReader::Expect(int token) {
  if (failed()) return false;
  if (scanner_.token() != token) {
    Fail(SYNTAX_ERROR, "Expected " + JsonScanner::TokenName(token) +
                       " but found " +
                       JsonScanner::TokenName(scanner_.token()));
    return false;
  }
  scanner_.NextToken();
  return !failed();
}

bool DocumentReader::SkipSeparator(int close) {
  if (failed()) return false;
  if (scanner_.token() == ',') {
    scanner_.NextToken();
    if (scanner_.token() == close) {
      Fail(SYNTAX_ERROR, "Unexpected " + JsonScanner::TokenName(close) +
                         " after ','");
    }
  } else if (scanner_.token() != close) {
    Fail(SYNTAX_ERROR, "Expected ',' or " + JsonScanner::TokenName(close) +
                       " but found " +
                       JsonScanner::TokenName(scanner_.token()));
  }
  return !failed();
}

bool DocumentReader::ParseKey(string *key) {
  if (failed()) return false;
  if (scanner_.token() != JsonScanner::STRING_TOKEN) {
    Fail(SYNTAX_ERROR, "Expected object key but found " +
                       JsonScanner::TokenName(scanner_.token()));
    return false;
  }
  *key = scanner_.token_text();
  scanner_.NextToken();
  return Expect(':');
}

void DocumentReader::ParseDocument() {
  if (scanner_.token() != '{') {
    Fail(INVALID_ARGUMENT, "Document must be a JSON object");
    return;
  }
  if (!Expect('{')) return;
  while (!failed() && scanner_.token() != '}') {
    string key;
    if (!ParseKey(&key)) return;
    if (key == "sentences") {
      ParseSentences();
    } else if (key == "coreference_clusters" || key == "coref_clusters") {
      ParseClusters();
    } else {
      SkipValue();
    }
    if (!SkipSeparator('}')) return;
  }
  if (!Expect('}')) return;

  if (!scanner_.done()) {
    Fail(SYNTAX_ERROR, "Unexpected " +
                       JsonScanner::TokenName(scanner_.token()) +
                       " after document");
  }
}

void DocumentReader::ParseSentences() {
  // A null sentence list is the same as no sentence list.
  if (scanner_.token() == JsonScanner::NULL_TOKEN) {
    scanner_.NextToken();
    return;
  }
  if (scanner_.token() != '[') {
    Fail(INVALID_ARGUMENT, "Field 'sentences' must be an array");
    return;
  }
  if (!Expect('[')) return;
  document_->set_has_sentences(true);
  while (!failed() && scanner_.token() != ']') {
    ParseSentence(document_->AddSentence());
    if (!SkipSeparator(']')) return;
  }
  Expect(']');
}

void DocumentReader::ParseSentence(Sentence *sentence) {
  if (scanner_.token() != '{') {
    Fail(INVALID_ARGUMENT, "Sentence must be a JSON object");
    return;
  }
  if (!Expect('{')) return;
  while (!failed() && scanner_.token() != '}') {
    string key;
    if (!ParseKey(&key)) return;
    if (key == "tokens") {
      ParseTokens(sentence);
    } else {
      SkipValue();
    }
    if (!SkipSeparator('}')) return;
  }
  Expect('}');
}

void DocumentReader::ParseTokens(Sentence *sentence) {
  if (scanner_.token() == JsonScanner::NULL_TOKEN) {
    scanner_.NextToken();
    return;
  }
  if (scanner_.token() != '[') {
    Fail(INVALID_ARGUMENT, "Field 'tokens' must be an array");
    return;
  }
  if (!Expect('[')) return;
  sentence->set_has_tokens(true);
  while (!failed() && scanner_.token() != ']') {
    if (scanner_.token() == JsonScanner::STRING_TOKEN) {
      sentence->AddToken(scanner_.token_text());
      scanner_.NextToken();
    } else {
      // Structured tokens only count towards the token sequence.
      SkipValue();
      sentence->AddToken("");
    }
    if (!SkipSeparator(']')) return;
  }
  Expect(']');
}

void DocumentReader::ParseClusters() {
  // Repeated cluster lists replace each other.
  document_->ClearClusters();
  document_->set_has_clusters(false);
  if (scanner_.token() == JsonScanner::NULL_TOKEN) {
    scanner_.NextToken();
    return;
  }
  if (scanner_.token() != '[') {
    Fail(INVALID_ARGUMENT, "Coreference clusters must be an array");
    return;
  }
  if (!Expect('[')) return;
  document_->set_has_clusters(true);
  while (!failed() && scanner_.token() != ']') {
    ParseCluster(document_->AddCluster());
    if (!SkipSeparator(']')) return;
  }
  Expect(']');
}

void DocumentReader::ParseCluster(CoreferenceCluster *cluster) {
  if (scanner_.token() != '{') {
    Fail(INVALID_ARGUMENT, "Coreference cluster must be a JSON object");
    return;
  }
  if (!Expect('{')) return;
  while (!failed() && scanner_.token() != '}') {
    string key;
    if (!ParseKey(&key)) return;
    if (key == "mentions") {
      ParseMentions(cluster);
    } else {
      SkipValue();
    }
    if (!SkipSeparator('}')) return;
  }
  Expect('}');
}

void DocumentReader::ParseMentions(CoreferenceCluster *cluster) {
  if (scanner_.token() == JsonScanner::NULL_TOKEN) {
    scanner_.NextToken();
    return;
  }
  if (scanner_.token() != '[') {
    Fail(INVALID_ARGUMENT, "Field 'mentions' must be an array");
    return;
  }
  if (!Expect('[')) return;
  cluster->set_has_mentions(true);
  while (!failed() && scanner_.token() != ']') {
    ParseMention(cluster);
    if (!SkipSeparator(']')) return;
  }
  Expect(']');
}

void DocumentReader::ParseMention(CoreferenceCluster *cluster) {
  if (scanner_.token() != '{') {
    Fail(INVALID_ARGUMENT, "Mention must be a JSON object");
    return;
  }
  if (!Expect('{')) return;
  bool has_start = false;
  bool has_end = false;
  int start = 0;
  int end = 0;
  while (!failed() && scanner_.token() != '}') {
    string key;
    if (!ParseKey(&key)) return;
    if (key == "start") {
      if (!ParseInteger(key, &start)) return;
      has_start = true;
    } else if (key == "end") {
      if (!ParseInteger(key, &end)) return;
      has_end = true;
    } else {
      SkipValue();
    }
    if (!SkipSeparator('}')) return;
  }
  if (!Expect('}')) return;

  if (!has_start) {
    Fail(MISSING_FIELD, "Mention is missing field 'start'");
  } else if (!has_end) {
    Fail(MISSING_FIELD, "Mention is missing field 'end'");
  } else {
    cluster->AddMention(start, end);
  }
}

bool DocumentReader::ParseInteger(const string &field, int *value) {
  if (scanner_.token() != JsonScanner::INTEGER_TOKEN) {
    Fail(INVALID_ARGUMENT, "Field '" + field + "' must be an integer but is " +
                           JsonScanner::TokenName(scanner_.token()));
    return false;
  }
  const string &text = scanner_.token_text();
  errno = 0;
  char *end = nullptr;
  long number = strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' ||
      number < std::numeric_limits<int>::min() ||
      number > std::numeric_limits<int>::max()) {
    Fail(INVALID_ARGUMENT, "Field '" + field + "' is out of range: " + text);
    return false;
  }
  *value = static_cast<int>(number);
  scanner_.NextToken();
  return !failed();
}

void DocumentReader::SkipValue() {
  if (failed()) return;
  int token = scanner_.token();
  if (token == '{' || token == '[') {
    if (depth_ >= kMaxNesting) {
      Fail(SYNTAX_ERROR, "Nesting too deep");
      return;
    }
    depth_++;
    SkipContainer();
    depth_--;
    return;
  }

  switch (token) {
    case JsonScanner::STRING_TOKEN:
    case JsonScanner::INTEGER_TOKEN:
    case JsonScanner::FLOAT_TOKEN:
    case JsonScanner::TRUE_TOKEN:
    case JsonScanner::FALSE_TOKEN:
    case JsonScanner::NULL_TOKEN:
      scanner_.NextToken();
      break;

    default:
      Fail(SYNTAX_ERROR, "Unexpected " + JsonScanner::TokenName(token));
  }
}

void DocumentReader::SkipContainer() {
  switch (scanner_.token()) {
    case '{':
      scanner_.NextToken();
      while (!failed() && scanner_.token() != '}') {
        string key;
        if (!ParseKey(&key)) return;
        SkipValue();
        if (!SkipSeparator('}')) return;
      }
      Expect('}');
      break;

    case '[':
      scanner_.NextToken();
      while (!failed() && scanner_.token() != ']') {
        SkipValue();
        if (!SkipSeparator(']')) return;
      }
      Expect(']');
      break;
  }
}

}  // namespace nlp
}  // namespace semview
