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

#ifndef SPOTTER_NLP_MATCHER_REGEX_MATCHER_H_
#define SPOTTER_NLP_MATCHER_REGEX_MATCHER_H_

#include <string>
#include <vector>

#include "re2/re2.h"
#include "spotter/base/macros.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/nlp/matcher/term-matcher.h"

namespace spotter {
namespace nlp {

// Regular expression matcher. Patterns are matched against the text of a
// token range, built from one token attribute with tokens separated by a
// space unless there is no break between them. Each match is expanded to
// the tokens it overlaps; matches that only cover token separators are
// dropped.
class RegexMatcher {
 public:
  RegexMatcher() = default;
  ~RegexMatcher();

  // Add patterns under label. The patterns are matched against the token
  // attribute. Returns INVALID_ARGUMENT if a pattern is not a valid regular
  // expression, in which case no patterns are added.
  Status Add(const string &label, const std::vector<string> &patterns,
             TokenAttribute attribute);

  // Find matches in the token range [begin;end[ of the document. Matches are
  // appended ordered by label registration order, then pattern order, then
  // position.
  void Match(const Document &document, int begin, int end,
             std::vector<nlp::Match> *matches) const;

  // Number of patterns.
  int size() const { return patterns_.size(); }

 private:
  // Compiled pattern for label.
  struct Pattern {
    string label;
    TokenAttribute attribute;
    RE2 *regex;
  };

  // Find all non-empty matches for pattern in text and add them as token
  // matches. The starts are the offsets of the tokens in the text.
  void Scan(const Pattern &pattern, const string &text,
            const std::vector<int> &starts, const std::vector<int> &ends,
            int begin, std::vector<nlp::Match> *matches) const;

  // Patterns in registration order.
  std::vector<Pattern> patterns_;

  DISALLOW_COPY_AND_ASSIGN(RegexMatcher);
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_REGEX_MATCHER_H_
