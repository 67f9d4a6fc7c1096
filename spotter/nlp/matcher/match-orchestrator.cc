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

#include "spotter/nlp/matcher/match-orchestrator.h"

#include <vector>

#include "spotter/base/logging.h"

namespace spotter {
namespace nlp {

void MatchOrchestrator::GetScopes(const Document &document,
                                  std::vector<Scope> *scopes) const {
  scopes->clear();
  if (!on_ents_only_) {
    if (document.length() > 0) scopes->push_back({0, document.length()});
    return;
  }

  // Each sentence with the start of a span is scanned once.
  for (const Span &span : document.spans()) {
    Scope sentence;
    document.GetSentence(span.begin(), &sentence.begin, &sentence.end);
    bool seen = false;
    for (const Scope &s : *scopes) {
      if (s.begin == sentence.begin) {
        seen = true;
        break;
      }
    }
    if (!seen) scopes->push_back(sentence);
  }
}

void MatchOrchestrator::Collect(const Document &document,
                                std::vector<Match> *matches) const {
  CHECK(patterns_->compiled());
  matches->clear();
  std::vector<Scope> scopes;
  GetScopes(document, &scopes);

  const TermMatcher *terms = patterns_->term_matcher();
  for (const Scope &scope : scopes) {
    terms->Match(document, scope.begin, scope.end, matches);
  }

  const RegexMatcher *regex = patterns_->regex_matcher();
  for (const Scope &scope : scopes) {
    regex->Match(document, scope.begin, scope.end, matches);
  }

  VLOG(2) << matches->size() << " matches in " << scopes.size() << " scopes";
}

void MatchOrchestrator::Process(const Document &document,
                                std::vector<Span> *spans) const {
  std::vector<Match> matches;
  Collect(document, &matches);
  spans->clear();
  spans->reserve(matches.size());
  for (const Match &match : matches) {
    spans->emplace_back(&document, match.begin, match.end, match.label);
  }
}

}  // namespace nlp
}  // namespace spotter
