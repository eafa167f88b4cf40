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

#include "semview/base/init.h"
#include "semview/base/logging.h"
#include "semview/base/status.h"
#include "semview/nlp/document/document-reader.h"
#include "semview/nlp/document/document.h"
#include "semview/util/json-scanner.h"

using namespace semview;
using namespace semview::nlp;

void TestScanner() {
  string text("{\"a\\tb\\u0041\": [-12, 3.5e2, true, null]}");
  JsonScanner scanner(text);
  CHECK_EQ(scanner.token(), '{');
  CHECK_EQ(scanner.NextToken(), JsonScanner::STRING_TOKEN);
  CHECK_EQ(scanner.token_text(), "a\tbA");
  CHECK_EQ(scanner.NextToken(), ':');
  CHECK_EQ(scanner.NextToken(), '[');
  CHECK_EQ(scanner.NextToken(), JsonScanner::INTEGER_TOKEN);
  CHECK_EQ(scanner.token_text(), "-12");
  CHECK_EQ(scanner.NextToken(), ',');
  CHECK_EQ(scanner.NextToken(), JsonScanner::FLOAT_TOKEN);
  CHECK_EQ(scanner.NextToken(), ',');
  CHECK_EQ(scanner.NextToken(), JsonScanner::TRUE_TOKEN);
  CHECK_EQ(scanner.NextToken(), ',');
  CHECK_EQ(scanner.NextToken(), JsonScanner::NULL_TOKEN);
  CHECK_EQ(scanner.NextToken(), ']');
  CHECK_EQ(scanner.NextToken(), '}');
  CHECK_EQ(scanner.NextToken(), JsonScanner::END);
  CHECK(scanner.done());

  string bad_text("\"unterminated");
  JsonScanner bad(bad_text);
  CHECK(bad.error());
  CHECK(!bad.error_message().empty());
}

void TestParse() {
  ParsedDocument document;
  CHECK(DocumentReader::Parse(
      "{\"title\": {\"nested\": [1, 2, {\"x\": null}]},"
      " \"sentences\": [{\"tokens\": [\"John\", \"saw\", \"him\"]},"
      "                 {\"tokens\": [\"He\", 42, \".\"], \"pos\": [\"PRP\"]}],"
      " \"coreference_clusters\": ["
      "   {\"mentions\": [{\"start\": 0, \"end\": 1}, {\"end\": 3, \"start\": 2}]},"
      "   {\"mentions\": []},"
      "   {}]}",
      &document));

  CHECK(document.has_sentences());
  CHECK_EQ(document.num_sentences(), 2);
  CHECK_EQ(document.num_tokens(), 6);
  CHECK_EQ(document.sentence_begin(1), 3);
  CHECK_EQ(document.sentence(0).word(1), "saw");
  CHECK_EQ(document.sentence(1).word(1), "");

  CHECK(document.has_clusters());
  CHECK_EQ(document.num_clusters(), 3);
  const CoreferenceCluster &first = document.cluster(0);
  CHECK_EQ(first.num_mentions(), 2);
  CHECK_EQ(first.mention(1).begin(), 2);
  CHECK_EQ(first.mention(1).end(), 3);
  CHECK(document.cluster(1).has_mentions());
  CHECK_EQ(document.cluster(1).num_mentions(), 0);
  CHECK(!document.cluster(2).has_mentions());
}

void TestOptionalFields() {
  ParsedDocument document;
  CHECK(DocumentReader::Parse("{}", &document));
  CHECK(!document.has_sentences());
  CHECK(!document.has_clusters());

  ParsedDocument legacy;
  CHECK(DocumentReader::Parse(
      "{\"sentences\": [{}],"
      " \"coref_clusters\": [{\"mentions\": [{\"start\": 0, \"end\": 0}]}]}",
      &legacy));
  CHECK(legacy.has_sentences());
  CHECK(!legacy.sentence(0).has_tokens());
  CHECK_EQ(legacy.num_clusters(), 1);
  CHECK_EQ(legacy.cluster(0).mention(0).length(), 0);
}

void TestErrors() {
  ParsedDocument document;
  Status st = DocumentReader::Parse("[1, 2]", &document);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);

  st = DocumentReader::Parse("{\"sentences\": [", &document);
  CHECK_EQ(st.code(), SYNTAX_ERROR);

  st = DocumentReader::Parse("{} {}", &document);
  CHECK_EQ(st.code(), SYNTAX_ERROR);

  st = DocumentReader::Parse("{\"sentences\": 7}", &document);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);

  ParsedDocument missing;
  st = DocumentReader::Parse(
      "{\"coreference_clusters\": [{\"mentions\": [{\"start\": 1}]}]}",
      &missing);
  CHECK_EQ(st.code(), MISSING_FIELD);
  CHECK(string(st.message()).find("'end'") != string::npos);

  ParsedDocument text;
  st = DocumentReader::Parse(
      "{\"coreference_clusters\": [{\"mentions\": "
      "[{\"start\": \"1\", \"end\": 2}]}]}",
      &text);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);

  ParsedDocument fraction;
  st = DocumentReader::Parse(
      "{\"coreference_clusters\": [{\"mentions\": "
      "[{\"start\": 1.5, \"end\": 2}]}]}",
      &fraction);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
}

void TestTrailingComma() {
  const char *documents[] = {
    "{\"sentences\": [{\"tokens\": [\"a\",]}]}",
    "{\"sentences\": [{\"tokens\": [\"a\"]},]}",
    "{\"sentences\": [],}",
    "{\"meta\": {\"x\": 1,}}",
  };
  for (const char *json : documents) {
    ParsedDocument document;
    Status st = DocumentReader::Parse(json, &document);
    CHECK_EQ(st.code(), SYNTAX_ERROR) << json;
  }
}

// Builds a document with an ignored field nested depth levels deep.
string NestedDocument(int depth) {
  return "{\"sentences\": [{\"tokens\": [\"a\"]}], \"meta\": " +
         string(depth, '[') + string(depth, ']') + "}";
}

void TestDeepNesting() {
  ParsedDocument shallow;
  CHECK(DocumentReader::Parse(NestedDocument(1000), &shallow));
  CHECK_EQ(shallow.num_tokens(), 1);

  ParsedDocument deep;
  Status st = DocumentReader::Parse(NestedDocument(1001), &deep);
  CHECK_EQ(st.code(), SYNTAX_ERROR);

  ParsedDocument deeper;
  st = DocumentReader::Parse(NestedDocument(100000), &deeper);
  CHECK_EQ(st.code(), SYNTAX_ERROR);
  CHECK(string(st.message()).find("Nesting too deep") != string::npos);

  // Structured tokens are skipped with the same limit.
  ParsedDocument tokens;
  st = DocumentReader::Parse("{\"sentences\": [{\"tokens\": [" +
                             string(5000, '[') + "]}]}", &tokens);
  CHECK_EQ(st.code(), SYNTAX_ERROR);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestScanner();
  TestParse();
  TestOptionalFields();
  TestErrors();
  TestTrailingComma();
  TestDeepNesting();

  std::cout << "PASS\n";
  return 0;
}
