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

#ifndef SEMVIEW_NLP_DOCUMENT_DOCUMENT_H_
#define SEMVIEW_NLP_DOCUMENT_DOCUMENT_H_

#include <string>
#include <vector>

#include "semview/base/types.h"

namespace semview {
namespace nlp {

// A mention is a range of tokens in the flattened token sequence of a
// document, i.e. the tokens of all sentences concatenated in sentence order.
// This is a half-open interval, so the mention covers the tokens in the range
// [begin;end[.
class Mention {
 public:
  Mention(int begin, int end) : begin_(begin), end_(end) {}

  int begin() const { return begin_; }
  int end() const { return end_; }

  // Returns the length of the mention in number of tokens. Mentions with
  // end <= begin are empty.
  int length() const { return end_ > begin_ ? end_ - begin_ : 0; }

 private:
  int begin_;
  int end_;
};

// A sentence is an ordered sequence of token words.
class Sentence {
 public:
  // Returns the number of tokens in the sentence.
  int length() const { return words_.size(); }

  // Returns token word.
  const string &word(int index) const { return words_[index]; }
  const std::vector<string> &words() const { return words_; }

  // Adds token to sentence. Tokens which are not plain strings in the input
  // are added with an empty word.
  void AddToken(const string &word) { words_.push_back(word); }

  // Whether the sentence carried a token list in the input.
  bool has_tokens() const { return has_tokens_; }
  void set_has_tokens(bool has_tokens) { has_tokens_ = has_tokens; }

 private:
  std::vector<string> words_;
  bool has_tokens_ = false;
};

// A coreference cluster is a list of mentions referring to the same entity.
// The identity of a cluster is its position in the cluster list of the
// document.
class CoreferenceCluster {
 public:
  int num_mentions() const { return mentions_.size(); }
  const Mention &mention(int index) const { return mentions_[index]; }
  const std::vector<Mention> &mentions() const { return mentions_; }

  // Adds mention to cluster.
  void AddMention(int begin, int end) {
    mentions_.emplace_back(begin, end);
    has_mentions_ = true;
  }

  // Whether the cluster carried a mention list in the input. A cluster with
  // an empty mention list has mentions, but a cluster without the field has
  // not.
  bool has_mentions() const { return has_mentions_; }
  void set_has_mentions(bool has_mentions) { has_mentions_ = has_mentions; }

 private:
  std::vector<Mention> mentions_;
  bool has_mentions_ = false;
};

// A parsed document holds the sentence and token structure of a text together
// with its coreference annotations. Documents are produced by an upstream
// parser and are read-only input for feature extraction.
class ParsedDocument {
 public:
  // Adds sentence to document and returns it. The returned pointer is only
  // valid until the next sentence is added.
  Sentence *AddSentence();

  // Adds coreference cluster to document and returns it. The returned pointer
  // is only valid until the next cluster is added.
  CoreferenceCluster *AddCluster();

  // Removes all coreference clusters.
  void ClearClusters();

  // Returns the number of sentences.
  int num_sentences() const { return sentences_.size(); }

  // Returns sentence in document.
  const Sentence &sentence(int index) const { return sentences_[index]; }
  const std::vector<Sentence> &sentences() const { return sentences_; }

  // Returns the total number of tokens across all sentences.
  int num_tokens() const;

  // Returns the index of the first token of a sentence in the flattened token
  // sequence.
  int sentence_begin(int index) const;

  // Returns the number of coreference clusters.
  int num_clusters() const { return clusters_.size(); }

  // Returns coreference cluster.
  const CoreferenceCluster &cluster(int index) const {
    return clusters_[index];
  }
  const std::vector<CoreferenceCluster> &clusters() const { return clusters_; }

  // Whether the input had a sentence list.
  bool has_sentences() const { return has_sentences_; }
  void set_has_sentences(bool has_sentences) { has_sentences_ = has_sentences; }

  // Whether the input had a coreference cluster list. Documents without one
  // have zero clusters.
  bool has_clusters() const { return has_clusters_; }
  void set_has_clusters(bool has_clusters) { has_clusters_ = has_clusters; }

 private:
  std::vector<Sentence> sentences_;
  std::vector<CoreferenceCluster> clusters_;
  bool has_sentences_ = false;
  bool has_clusters_ = false;
};

}  // namespace nlp
}  // namespace semview

#endif  // SEMVIEW_NLP_DOCUMENT_DOCUMENT_H_
