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

#include "spotter/nlp/matcher/pattern-compiler.h"

#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/nlp/matcher/fuzzy-matcher.h"
#include "spotter/nlp/matcher/phrase-matcher.h"

namespace spotter {
namespace nlp {

void CompiledPatterns::Clear() {
  delete term_matcher_;
  delete regex_matcher_;
  term_matcher_ = nullptr;
  regex_matcher_ = nullptr;
  attributes_.clear();
}

Status PatternCompiler::Compile(const MatcherConfig &config,
                                const AttributeMap &attributes,
                                CompiledPatterns *patterns,
                                Diagnostics *diagnostics) const {
  // Select term matcher.
  TokenAttribute term_attr = attributes.term_attribute();
  TermMatcher *term_matcher;
  if (config.fuzzy) {
    diagnostics->Warning(
        "Fuzzy matching has been requested, which increases matching time "
        "significantly (60x slower is common)");
    term_matcher = new FuzzyMatcher(term_attr, config.fuzzy_options);
  } else {
    term_matcher = new PhraseMatcher(term_attr);
  }

  // Add terms.
  std::vector<string> tokens;
  for (const TermSet::Entry &entry : config.terms.entries()) {
    for (const string &term : entry.values) {
      tokenizer_.Tokenize(term, term_attr, &tokens);
      if (tokens.empty()) {
        diagnostics->Warning("Term '" + term + "' for " + entry.label +
                             " has no tokens and is skipped");
        continue;
      }
      term_matcher->Add(entry.label, tokens);
    }
  }

  // Add regular expressions.
  RegexMatcher *regex_matcher = new RegexMatcher();
  for (const RegexSet::Entry &entry : config.regex.entries()) {
    Status st = regex_matcher->Add(entry.label, entry.values,
                                   attributes.Get(entry.label));
    if (!st.ok()) {
      delete term_matcher;
      delete regex_matcher;
      return st;
    }
  }

  VLOG(1) << "Compiled " << term_matcher->size() << " terms and "
          << regex_matcher->size() << " regular expressions";

  patterns->Clear();
  patterns->term_matcher_ = term_matcher;
  patterns->regex_matcher_ = regex_matcher;
  patterns->attributes_ = attributes;
  return Status::OK;
}

}  // namespace nlp
}  // namespace spotter
