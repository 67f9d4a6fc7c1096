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

#ifndef SPOTTER_NLP_MATCHER_FUZZY_MATCHER_H_
#define SPOTTER_NLP_MATCHER_FUZZY_MATCHER_H_

#include <string>
#include <vector>

#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/matcher/matcher-config.h"
#include "spotter/nlp/matcher/term-matcher.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

// Computes the normalized indel similarity of two strings on a 0-100 scale,
// i.e. 100 * (1 - d / (n + m)) where d is the number of insertions and
// deletions needed to turn one string into the other and n and m are the
// string lengths in characters. Two empty strings have similarity 100.
double FuzzyRatio(const ustring &a, const ustring &b);
double FuzzyRatio(const string &a, const string &b);

// Approximate term matcher. Each term is compared with every window of
// document tokens whose length is within the flex margin of the term length.
// Windows with a similarity ratio at or above the minimum ratio are
// candidates, and for each term the best non-overlapping candidates are
// selected greedily by descending ratio.
class FuzzyMatcher : public TermMatcher {
 public:
  FuzzyMatcher(TokenAttribute attribute, const FuzzyOptions &options)
      : TermMatcher(attribute), options_(options) {}

  // Term matcher interface.
  void Add(const string &label, const std::vector<string> &tokens) override;
  void Match(const Document &document, int begin, int end,
             std::vector<nlp::Match> *matches) const override;
  MatchSource source() const override { return MATCH_FUZZY; }
  int size() const override { return terms_.size(); }

  // Matching options.
  const FuzzyOptions &options() const { return options_; }

 private:
  // Term with its text prepared for comparison.
  struct Term {
    string label;
    int length;
    ustring text;
  };

  // Converts text to code points for comparison.
  void Prepare(const string &text, ustring *result) const;

  // Matching options.
  FuzzyOptions options_;

  // Terms in registration order.
  std::vector<Term> terms_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_FUZZY_MATCHER_H_
