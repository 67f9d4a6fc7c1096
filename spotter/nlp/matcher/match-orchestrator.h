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

#ifndef SPOTTER_NLP_MATCHER_MATCH_ORCHESTRATOR_H_
#define SPOTTER_NLP_MATCHER_MATCH_ORCHESTRATOR_H_

#include <vector>

#include "spotter/nlp/document/document.h"
#include "spotter/nlp/matcher/pattern-compiler.h"
#include "spotter/nlp/matcher/term-matcher.h"

namespace spotter {
namespace nlp {

// Runs the compiled matchers over a document. In whole-document mode the
// matchers scan all tokens. In entity-scoped mode they scan each sentence
// holding the first token of an existing span, once per sentence and in the
// order the sentences are found. Term matches come before regex matches.
class MatchOrchestrator {
 public:
  // Token range to scan.
  struct Scope {
    int begin;
    int end;
  };

  MatchOrchestrator(const CompiledPatterns *patterns, bool on_ents_only)
      : patterns_(patterns), on_ents_only_(on_ents_only) {}

  // Collect matches for document.
  void Collect(const Document &document, std::vector<Match> *matches) const;

  // Find spans for document. The spans are the collected matches in the same
  // order, bound to the document.
  void Process(const Document &document, std::vector<Span> *spans) const;

  // Get the token ranges to scan in document.
  void GetScopes(const Document &document, std::vector<Scope> *scopes) const;

 private:
  // Compiled matchers.
  const CompiledPatterns *patterns_;

  // Only scan sentences with existing spans.
  bool on_ents_only_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_MATCH_ORCHESTRATOR_H_
