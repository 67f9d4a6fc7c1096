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

#ifndef SPOTTER_NLP_MATCHER_GENERIC_MATCHER_H_
#define SPOTTER_NLP_MATCHER_GENERIC_MATCHER_H_

#include <string>
#include <vector>

#include "spotter/base/macros.h"
#include "spotter/base/status.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/phrase-tokenizer.h"
#include "spotter/nlp/matcher/match-orchestrator.h"
#include "spotter/nlp/matcher/matcher-config.h"
#include "spotter/nlp/matcher/pattern-compiler.h"

namespace spotter {
namespace nlp {

// Generic matcher for finding vocabulary terms and regular expressions in
// documents. Example:
//
//   MatcherConfig config;
//   config.terms.Add("drug", "aspirin");
//   config.regex.Add("dose", "\\d+mg");
//
//   GenericMatcher matcher;
//   CHECK(matcher.Init(config, {}));
//   matcher.Annotate(&document);
//
// The matcher is not modified after initialization, so one matcher can be
// used by several threads annotating different documents.
class GenericMatcher {
 public:
  GenericMatcher() = default;
  ~GenericMatcher();

  // Initialize matcher from configuration. The pipe names are the names of
  // the stages that have processed the documents before the matcher. The
  // optional preprocessor is applied to term phrases after tokenization.
  // Configuration warnings are logged and kept in the diagnostics. Returns
  // INVALID_ARGUMENT for unsupported attributes, invalid regular expressions,
  // and fuzzy options out of range.
  Status Init(const MatcherConfig &config,
              const std::vector<string> &pipe_names,
              const PhraseTokenizer::Preprocessor &preprocessor = nullptr);

  // Find spans in document, filtered for overlaps if enabled.
  void Process(const Document &document, std::vector<Span> *spans) const;

  // Replace the spans in the document with the spans found in it.
  void Annotate(Document *document) const;

  // Matcher configuration.
  const MatcherConfig &config() const { return config_; }

  // Compiled patterns.
  const CompiledPatterns &patterns() const { return patterns_; }

  // Warnings from initialization.
  const Diagnostics &diagnostics() const { return diagnostics_; }

 private:
  // Matcher configuration.
  MatcherConfig config_;

  // Compiled matchers.
  CompiledPatterns patterns_;

  // Orchestrator for running the matchers.
  MatchOrchestrator *orchestrator_ = nullptr;

  // Configuration warnings.
  Diagnostics diagnostics_;

  DISALLOW_COPY_AND_ASSIGN(GenericMatcher);
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_GENERIC_MATCHER_H_
