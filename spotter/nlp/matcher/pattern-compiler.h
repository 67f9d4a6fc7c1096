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

#ifndef SPOTTER_NLP_MATCHER_PATTERN_COMPILER_H_
#define SPOTTER_NLP_MATCHER_PATTERN_COMPILER_H_

#include "spotter/base/macros.h"
#include "spotter/base/status.h"
#include "spotter/nlp/document/phrase-tokenizer.h"
#include "spotter/nlp/matcher/attributes.h"
#include "spotter/nlp/matcher/matcher-config.h"
#include "spotter/nlp/matcher/regex-matcher.h"
#include "spotter/nlp/matcher/term-matcher.h"

namespace spotter {
namespace nlp {

// Compiled matcher state with the term matcher, the regex matcher, and the
// attribute map they were built from. It is not modified after compilation,
// so it can be shared by threads matching different documents.
class CompiledPatterns {
 public:
  CompiledPatterns() = default;
  ~CompiledPatterns() { Clear(); }

  // Term matcher, or null if not compiled.
  const TermMatcher *term_matcher() const { return term_matcher_; }

  // Regex matcher, or null if not compiled.
  const RegexMatcher *regex_matcher() const { return regex_matcher_; }

  // Attributes for terms and regex labels.
  const AttributeMap &attributes() const { return attributes_; }

  // Check if patterns have been compiled.
  bool compiled() const { return term_matcher_ != nullptr; }

 private:
  // Delete matchers.
  void Clear();

  TermMatcher *term_matcher_ = nullptr;
  RegexMatcher *regex_matcher_ = nullptr;
  AttributeMap attributes_;

  friend class PatternCompiler;

  DISALLOW_COPY_AND_ASSIGN(CompiledPatterns);
};

// Builds the matchers for a matcher configuration. Terms are tokenized with
// the phrase tokenizer and added to a fuzzy or exact term matcher, and regex
// patterns are added to the regex matcher with the attribute for their label.
class PatternCompiler {
 public:
  // Set preprocessor for term phrases, e.g. for computing normalized forms of
  // the term tokens.
  void set_preprocessor(const PhraseTokenizer::Preprocessor &preprocessor) {
    tokenizer_.set_preprocessor(preprocessor);
  }

  // Compile patterns. Any existing matchers in the compiled patterns are
  // replaced on success. Returns INVALID_ARGUMENT for invalid regular
  // expressions, in which case the compiled patterns are not changed.
  Status Compile(const MatcherConfig &config, const AttributeMap &attributes,
                 CompiledPatterns *patterns, Diagnostics *diagnostics) const;

 private:
  // Tokenizer for terms.
  PhraseTokenizer tokenizer_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_PATTERN_COMPILER_H_
