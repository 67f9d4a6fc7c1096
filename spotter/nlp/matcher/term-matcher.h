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

#ifndef SPOTTER_NLP_MATCHER_TERM_MATCHER_H_
#define SPOTTER_NLP_MATCHER_TERM_MATCHER_H_

#include <ostream>
#include <string>
#include <vector>

#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/token-properties.h"

namespace spotter {
namespace nlp {

// Matching engine that produced a match.
enum MatchSource {
  MATCH_EXACT = 0,
  MATCH_FUZZY = 1,
  MATCH_REGEX = 2,
};

// Returns name of match source.
const char *MatchSourceName(MatchSource source);

// A labeled token range [begin;end[ found by a matching engine.
struct Match {
  Match() = default;
  Match(const string &label, int begin, int end, MatchSource source,
        double ratio = 100.0)
      : label(label), begin(begin), end(end), source(source), ratio(ratio) {}

  bool operator==(const Match &other) const {
    return label == other.label && begin == other.begin &&
           end == other.end && source == other.source;
  }

  string label;
  int begin = 0;
  int end = 0;
  MatchSource source = MATCH_EXACT;

  // Similarity ratio (0-100) for fuzzy matches, 100 for other matches.
  double ratio = 100.0;
};

// Output match as [begin,end) label/source.
std::ostream &operator<<(std::ostream &out, const Match &match);

// Interface for term matching engines. Terms are token sequences registered
// under a label and matched against one token attribute of the document.
class TermMatcher {
 public:
  explicit TermMatcher(TokenAttribute attribute) : attribute_(attribute) {}
  virtual ~TermMatcher() = default;

  // Add term under label. Terms with no tokens are ignored.
  virtual void Add(const string &label, const std::vector<string> &tokens) = 0;

  // Find terms in the token range [begin;end[ of the document. Matches are
  // appended ordered by begin, then end, then label registration order.
  virtual void Match(const Document &document, int begin, int end,
                     std::vector<nlp::Match> *matches) const = 0;

  // Returns the match source for the engine.
  virtual MatchSource source() const = 0;

  // Number of terms in the matcher.
  virtual int size() const = 0;

  // Token attribute for matching.
  TokenAttribute attribute() const { return attribute_; }

 private:
  TokenAttribute attribute_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_TERM_MATCHER_H_
