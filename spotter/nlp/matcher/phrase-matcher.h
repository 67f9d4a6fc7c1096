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

#ifndef SPOTTER_NLP_MATCHER_PHRASE_MATCHER_H_
#define SPOTTER_NLP_MATCHER_PHRASE_MATCHER_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/matcher/label-table.h"
#include "spotter/nlp/matcher/term-matcher.h"

namespace spotter {
namespace nlp {

// Exact phrase matcher. Phrases are indexed by the fingerprint of their token
// sequence, and candidate token ranges in the document are looked up by
// fingerprint and then compared token by token.
class PhraseMatcher : public TermMatcher {
 public:
  explicit PhraseMatcher(TokenAttribute attribute) : TermMatcher(attribute) {}

  // Term matcher interface.
  void Add(const string &label, const std::vector<string> &tokens) override;
  void Match(const Document &document, int begin, int end,
             std::vector<nlp::Match> *matches) const override;
  MatchSource source() const override { return MATCH_EXACT; }
  int size() const override { return size_; }

  // Label table for phrase labels.
  const LabelTable &labels() const { return labels_; }

 private:
  // Phrase registered under a label.
  struct Phrase {
    int label;
    std::vector<string> tokens;
  };

  // Phrases indexed by phrase fingerprint.
  std::unordered_map<uint64, std::vector<Phrase>> phrases_;

  // Label ids for phrases.
  LabelTable labels_;

  // Number of tokens in the longest phrase.
  int max_length_ = 0;

  // Number of distinct phrases.
  int size_ = 0;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_PHRASE_MATCHER_H_
