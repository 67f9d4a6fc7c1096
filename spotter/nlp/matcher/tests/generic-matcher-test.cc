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

#include <stdio.h>
#include <unistd.h>
#include <iostream>
#include <string>
#include <vector>

#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/base/status.h"
#include "spotter/nlp/document/annotator.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/nlp/matcher/generic-matcher.h"
#include "spotter/nlp/matcher/matcher-config.h"

using namespace spotter;
using namespace spotter::nlp;

// Collects warnings logged while installed.
class WarningCollector : public LogSink {
 public:
  WarningCollector() { previous_ = LogMessage::SetSink(this); }
  ~WarningCollector() { LogMessage::SetSink(previous_); }

  void Send(int severity, const char *fname, int line,
            const string &message) override {
    if (severity == WARNING) warnings_.push_back(message);
  }

  bool Contains(const string &text) const {
    for (const string &w : warnings_) {
      if (w.find(text) != string::npos) return true;
    }
    return false;
  }

  const std::vector<string> &warnings() const { return warnings_; }

 private:
  LogSink *previous_;
  std::vector<string> warnings_;
};

// Writes contents to a temporary file and returns its name.
string WriteTempFile(const string &contents) {
  char name[] = "/tmp/spotter-lexicon-XXXXXX";
  int fd = mkstemp(name);
  CHECK_GE(fd, 0);
  CHECK_EQ(write(fd, contents.data(), contents.size()), contents.size());
  close(fd);
  return name;
}

void TestTermMatch() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Patient takes aspirin daily");

  MatcherConfig config;
  config.terms.Add("drug", "aspirin");
  GenericMatcher matcher;
  CHECK(matcher.Init(config, {}));
  CHECK(matcher.diagnostics().empty());

  matcher.Annotate(&document);
  CHECK_EQ(document.num_spans(), 1);
  CHECK_EQ(document.span(0).label(), "drug");
  CHECK_EQ(document.span(0).begin(), 2);
  CHECK_EQ(document.span(0).end(), 3);
  CHECK_EQ(document.span(0).GetText(), "aspirin");
}

void TestRegexMatch() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Take 50mg now");

  MatcherConfig config;
  config.regex.Add("dose", "\\d+mg");
  config.attr = AttributeSpec::PerLabel({{"dose", "TEXT"}});
  GenericMatcher matcher;
  CHECK(matcher.Init(config, {}));

  matcher.Annotate(&document);
  CHECK_EQ(document.num_spans(), 1);
  CHECK_EQ(document.span(0).label(), "dose");
  CHECK_EQ(document.span(0).GetText(), "50mg");
}

void TestFuzzyMatch() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Patient takes asprin daily");

  MatcherConfig config;
  config.terms.Add("aspirin", "aspirin");
  config.fuzzy = true;
  config.fuzzy_options.min_ratio = 90.0;
  GenericMatcher matcher;
  {
    WarningCollector collector;
    CHECK(matcher.Init(config, {}));
    CHECK(collector.Contains("60x slower"));
  }
  CHECK(matcher.diagnostics().Contains("Fuzzy matching"));
  CHECK_EQ(matcher.patterns().term_matcher()->source(), MATCH_FUZZY);

  matcher.Annotate(&document);
  CHECK_EQ(document.num_spans(), 1);
  CHECK_EQ(document.span(0).label(), "aspirin");
  CHECK_EQ(document.span(0).GetText(), "asprin");

  config.fuzzy_options.min_ratio = 99.0;
  GenericMatcher strict;
  CHECK(strict.Init(config, {}));
  strict.Annotate(&document);
  CHECK_EQ(document.num_spans(), 0);
}

void TestUnfilteredOrder() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Take 50mg aspirin");

  MatcherConfig config;
  config.regex.Add("dose", "\\d+mg aspirin");
  config.terms.Add("drug", "aspirin");
  config.filter_matches = false;
  GenericMatcher matcher;
  CHECK(matcher.Init(config, {}));

  // Term matches come before regex matches.
  std::vector<Span> spans;
  matcher.Process(document, &spans);
  CHECK_EQ(spans.size(), 2);
  CHECK_EQ(spans[0].label(), "drug");
  CHECK_EQ(spans[1].label(), "dose");

  // With filtering the longer regex match wins.
  config.filter_matches = true;
  GenericMatcher filtered;
  CHECK(filtered.Init(config, {}));
  filtered.Process(document, &spans);
  CHECK_EQ(spans.size(), 1);
  CHECK_EQ(spans[0].label(), "dose");
  CHECK_EQ(spans[0].begin(), 1);
  CHECK_EQ(spans[0].end(), 3);
}

void TestEntityScope() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document,
                     "Aspirin was stopped. Patient takes aspirin daily. "
                     "No aspirin allergy.");

  MatcherConfig config;
  config.terms.Add("drug", "aspirin");
  config.attr = AttributeSpec::Uniform("NORM");
  config.on_ents_only = true;
  GenericMatcher matcher;
  CHECK(matcher.Init(config, {"normalizer"}));

  // Without existing spans nothing is matched.
  std::vector<Span> spans;
  matcher.Process(document, &spans);
  CHECK(spans.empty());

  // Only sentences with existing spans are searched.
  document.AddSpan(4, 5, "person");
  document.AddSpan(5, 6, "verb");
  matcher.Process(document, &spans);
  CHECK_EQ(spans.size(), 1);
  CHECK_EQ(spans[0].begin(), 6);
  CHECK_EQ(spans[0].end(), 7);

  // Annotating replaces the existing spans.
  matcher.Annotate(&document);
  CHECK_EQ(document.num_spans(), 1);
  CHECK_EQ(document.span(0).label(), "drug");
}

void TestInvalidConfig() {
  MatcherConfig config;
  config.terms.Add("drug", "aspirin");
  config.attr = AttributeSpec::Uniform("LEMMA");
  GenericMatcher matcher;
  Status st = matcher.Init(config, {});
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
  CHECK(!matcher.patterns().compiled());

  config.attr = AttributeSpec();
  config.regex.Add("dose", "(\\d+");
  GenericMatcher bad_regex;
  st = bad_regex.Init(config, {});
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
  CHECK(!bad_regex.patterns().compiled());
}

void TestInvalidFuzzyOptions() {
  MatcherConfig config;
  config.terms.Add("drug", "aspirin");
  config.fuzzy = true;

  config.fuzzy_options.flex = -3;
  GenericMatcher negative_flex;
  CHECK_EQ(negative_flex.Init(config, {}).code(), INVALID_ARGUMENT);
  CHECK(!negative_flex.patterns().compiled());

  config.fuzzy_options.flex = 1;
  config.fuzzy_options.min_ratio = 150.0;
  GenericMatcher high_ratio;
  CHECK_EQ(high_ratio.Init(config, {}).code(), INVALID_ARGUMENT);
  CHECK(!high_ratio.patterns().compiled());

  config.fuzzy_options.min_ratio = -1.0;
  GenericMatcher low_ratio;
  CHECK_EQ(low_ratio.Init(config, {}).code(), INVALID_ARGUMENT);
  CHECK(!low_ratio.patterns().compiled());

  // Both ends of the ratio range are accepted.
  config.fuzzy_options.min_ratio = 100.0;
  config.fuzzy_options.flex = 0;
  GenericMatcher exact_ratio;
  CHECK(exact_ratio.Init(config, {}));
  CHECK(exact_ratio.patterns().compiled());
  config.fuzzy_options.min_ratio = 0.0;
  GenericMatcher any_ratio;
  CHECK(any_ratio.Init(config, {}));
}

void TestWarnings() {
  MatcherConfig config;
  config.terms.Add("drug", "aspirin");
  config.terms.Add("drug", " ");
  config.regex.Add("dose", "\\d+mg");
  config.attr = AttributeSpec::PerLabel({{"dose", "TEXT"}, {"route", "NORM"}});

  WarningCollector collector;
  GenericMatcher matcher;
  CHECK(matcher.Init(config, {}));
  CHECK(collector.Contains("route"));
  CHECK(collector.Contains("no tokens"));
  CHECK(collector.Contains("no normalizer"));
  CHECK_EQ(collector.warnings().size(), matcher.diagnostics().warnings().size());
}

void TestPipeline() {
  string terms = WriteTempFile(
      "# drug lexicon\n"
      "drug\tParacétamol\n"
      "drug\taspirin\r\n");
  string regex = WriteTempFile("dose\t\\d+ ?mg\n");

  Pipeline pipeline;
  CHECK(pipeline.Add("normalizer"));
  AnnotatorConfig config;
  config.Set("terms", terms);
  config.Set("regex", regex);
  config.Set("attr", "NORM");
  CHECK(pipeline.Add("generic-matcher", config));

  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Paracetamol 500 mg and ASPIRIN");
  pipeline.Annotate(&document);
  CHECK_EQ(document.num_spans(), 3);
  CHECK_EQ(document.span(0).label(), "drug");
  CHECK_EQ(document.span(0).GetText(), "Paracetamol");
  CHECK_EQ(document.span(1).label(), "dose");
  CHECK_EQ(document.span(1).GetText(), "500 mg");
  CHECK_EQ(document.span(2).label(), "drug");
  CHECK_EQ(document.span(2).GetText(), "ASPIRIN");

  // Configuration errors are reported when the annotator is added.
  AnnotatorConfig bad;
  bad.Set("terms", "/nonexistent/lexicon.tsv");
  CHECK_EQ(pipeline.Add("generic-matcher", bad).code(), NOT_FOUND);
  bad = AnnotatorConfig();
  bad.Set("flex", "wide");
  CHECK_EQ(pipeline.Add("generic-matcher", bad).code(), INVALID_ARGUMENT);
  bad = AnnotatorConfig();
  bad.Set("attr", "SHAPE");
  CHECK_EQ(pipeline.Add("generic-matcher", bad).code(), INVALID_ARGUMENT);
  bad = AnnotatorConfig();
  bad.Set("flex", -3);
  CHECK_EQ(pipeline.Add("generic-matcher", bad).code(), INVALID_ARGUMENT);
  bad = AnnotatorConfig();
  bad.Set("min_ratio", 101.0);
  CHECK_EQ(pipeline.Add("generic-matcher", bad).code(), INVALID_ARGUMENT);

  // Entity scope finds nothing until an earlier stage has added spans.
  Pipeline scoped;
  AnnotatorConfig entities;
  entities.Set("terms", terms);
  entities.Set("on_ents_only", true);
  CHECK(scoped.Add("generic-matcher", entities));
  Document plain;
  tokenizer.Tokenize(&plain, "Take aspirin daily.");
  scoped.Annotate(&plain);
  CHECK_EQ(plain.num_spans(), 0);

  unlink(terms.c_str());
  unlink(regex.c_str());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestTermMatch();
  TestRegexMatch();
  TestFuzzyMatch();
  TestUnfilteredOrder();
  TestEntityScope();
  TestInvalidConfig();
  TestInvalidFuzzyOptions();
  TestWarnings();
  TestPipeline();

  std::cout << "PASS\n";
  return 0;
}
