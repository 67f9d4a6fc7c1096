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

#include "spotter/nlp/matcher/generic-matcher.h"

#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/nlp/document/annotator.h"
#include "spotter/nlp/matcher/attributes.h"
#include "spotter/nlp/matcher/span-filter.h"
#include "spotter/string/text.h"

namespace spotter {
namespace nlp {

GenericMatcher::~GenericMatcher() {
  delete orchestrator_;
}

Status GenericMatcher::Init(const MatcherConfig &config,
                            const std::vector<string> &pipe_names,
                            const PhraseTokenizer::Preprocessor &preprocessor) {
  diagnostics_.clear();

  // Check fuzzy matching options.
  const FuzzyOptions &fuzzy = config.fuzzy_options;
  if (fuzzy.min_ratio < 0.0 || fuzzy.min_ratio > 100.0) {
    return Status(INVALID_ARGUMENT,
                  "Minimum fuzzy ratio must be between 0 and 100: " +
                  std::to_string(fuzzy.min_ratio));
  }
  if (fuzzy.flex < 0) {
    return Status(INVALID_ARGUMENT,
                  "Fuzzy window flex must not be negative: " +
                  std::to_string(fuzzy.flex));
  }

  // Resolve the token attributes for terms and regex labels.
  AttributeMap attributes;
  Status st = ResolveAttributes(config.attr, config.regex, pipe_names,
                                &attributes, &diagnostics_);

  // Build matchers.
  if (st.ok()) {
    PatternCompiler compiler;
    if (preprocessor) compiler.set_preprocessor(preprocessor);
    st = compiler.Compile(config, attributes, &patterns_, &diagnostics_);
  }

  for (const string &warning : diagnostics_.warnings()) {
    LOG(WARNING) << warning;
  }
  if (!st.ok()) return st;

  config_ = config;
  delete orchestrator_;
  orchestrator_ = new MatchOrchestrator(&patterns_, config_.on_ents_only);
  return Status::OK;
}

void GenericMatcher::Process(const Document &document,
                             std::vector<Span> *spans) const {
  CHECK(orchestrator_ != nullptr) << "Matcher not initialized";
  orchestrator_->Process(document, spans);
  if (config_.filter_matches) FilterSpans(spans);
}

void GenericMatcher::Annotate(Document *document) const {
  std::vector<Span> spans;
  Process(*document, &spans);
  document->ReplaceSpans(spans);
}

// Document annotator for the generic matcher. Terms and regular expressions
// are read from lexicon files with one label and string per line.
class GenericMatcherAnnotator : public Annotator {
 public:
  Status Init(const AnnotatorConfig &config,
              const Pipeline &upstream) override {
    static const char *kParameters[] = {
      "terms", "regex", "attr", "fuzzy", "min_ratio", "ignore_case", "flex",
      "filter_matches", "on_ents_only",
    };
    for (const string &name : config.names()) {
      bool known = false;
      for (const char *p : kParameters) {
        if (name == p) known = true;
      }
      if (!known) LOG(WARNING) << "Unknown generic-matcher parameter: " << name;
    }

    MatcherConfig mc;
    Status st;
    for (const string &file : Split(config.Get("terms", ""))) {
      st = mc.terms.Load(file);
      if (!st.ok()) return st;
    }
    for (const string &file : Split(config.Get("regex", ""))) {
      st = mc.regex.Load(file);
      if (!st.ok()) return st;
    }
    st = AttributeSpec::Parse(config.Get("attr", "TEXT"), &mc.attr);
    if (!st.ok()) return st;
    st = config.Get("fuzzy", false, &mc.fuzzy);
    if (!st.ok()) return st;
    st = config.Get("min_ratio", mc.fuzzy_options.min_ratio,
                    &mc.fuzzy_options.min_ratio);
    if (!st.ok()) return st;
    st = config.Get("ignore_case", mc.fuzzy_options.ignore_case,
                    &mc.fuzzy_options.ignore_case);
    if (!st.ok()) return st;
    st = config.Get("flex", mc.fuzzy_options.flex, &mc.fuzzy_options.flex);
    if (!st.ok()) return st;
    st = config.Get("filter_matches", true, &mc.filter_matches);
    if (!st.ok()) return st;
    st = config.Get("on_ents_only", false, &mc.on_ents_only);
    if (!st.ok()) return st;

    // Term phrases are preprocessed by the upstream annotators so they get
    // the same normalized forms as the documents.
    const Pipeline *pipeline = &upstream;
    return matcher_.Init(mc, upstream.names(),
                         [pipeline](Document *phrase) {
                           pipeline->Annotate(phrase);
                         });
  }

  void Annotate(Document *document) override {
    matcher_.Annotate(document);
  }

 private:
  // Split comma-separated file list.
  static std::vector<string> Split(const string &list) {
    std::vector<string> files;
    for (Text part : Text(list).split(',')) {
      part = part.trim();
      if (!part.empty()) files.push_back(part.str());
    }
    return files;
  }

  GenericMatcher matcher_;
};

REGISTER_ANNOTATOR("generic-matcher", GenericMatcherAnnotator);

}  // namespace nlp
}  // namespace spotter
