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

#include <iostream>
#include <string>
#include <vector>

#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/base/status.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/nlp/matcher/attributes.h"
#include "spotter/nlp/matcher/matcher-config.h"

using namespace spotter;
using namespace spotter::nlp;

void TestLabeledStrings() {
  RegexSet regex;
  regex.Add("dose", "\\d+mg");
  regex.Add("route", std::vector<string>{"oral", "iv"});
  regex.Add("dose", "\\d+ ml");
  CHECK_EQ(regex.size(), 2);
  CHECK(regex.Has("dose"));
  CHECK(!regex.Has("drug"));
  CHECK_EQ(regex.Find("dose")->size(), 2);
  std::vector<string> labels = regex.labels();
  CHECK_EQ(labels.size(), 2);
  CHECK_EQ(labels[0], "dose");
  CHECK_EQ(labels[1], "route");
}

void TestParseSpec() {
  AttributeSpec spec;
  CHECK(spec.uniform());
  CHECK_EQ(spec.value(), "TEXT");

  CHECK(AttributeSpec::Parse("norm", &spec));
  CHECK(spec.uniform());
  CHECK_EQ(spec.value(), "norm");

  CHECK(AttributeSpec::Parse("dose=TEXT, term_attr=NORM", &spec));
  CHECK(!spec.uniform());
  CHECK_EQ(spec.values().size(), 2);
  CHECK_EQ(spec.values()[0].first, "dose");
  CHECK_EQ(spec.values()[1].second, "NORM");

  CHECK(!AttributeSpec::Parse("", &spec).ok());
  CHECK(!AttributeSpec::Parse("dose=TEXT,=NORM", &spec).ok());
}

void TestUniformAttribute() {
  RegexSet regex;
  regex.Add("dose", "\\d+mg");
  AttributeMap attributes;
  Diagnostics diagnostics;
  CHECK(ResolveAttributes(AttributeSpec::Uniform("text"), regex, {},
                          &attributes, &diagnostics));
  CHECK_EQ(attributes.size(), 2);
  CHECK_EQ(attributes.Get("dose"), ATTR_TEXT);
  CHECK_EQ(attributes.term_attribute(), ATTR_TEXT);
  CHECK(diagnostics.empty());
}

void TestPerLabelAttributes() {
  RegexSet regex;
  regex.Add("dose", "\\d+mg");
  regex.Add("route", "oral");
  AttributeSpec spec = AttributeSpec::PerLabel({
    {"dose", "TEXT"}, {"unknown", "TEXT"},
  });
  AttributeMap attributes;
  Diagnostics diagnostics;
  CHECK(ResolveAttributes(spec, regex, {"normalizer"}, &attributes,
                          &diagnostics));

  // Labels without an attribute default to NORM.
  CHECK_EQ(attributes.Get("dose"), ATTR_TEXT);
  CHECK_EQ(attributes.Get("route"), ATTR_NORM);
  CHECK_EQ(attributes.Get(kTermAttribute), ATTR_NORM);
  CHECK(!attributes.Has("unknown"));
  CHECK_EQ(diagnostics.warnings().size(), 1);
  CHECK(diagnostics.Contains("unknown"));
}

void TestNormWithoutNormalizer() {
  RegexSet regex;
  AttributeMap attributes;
  Diagnostics diagnostics;
  CHECK(ResolveAttributes(AttributeSpec::Uniform("NORM"), regex, {"tagger"},
                          &attributes, &diagnostics));
  CHECK_EQ(attributes.term_attribute(), ATTR_NORM);
  CHECK(diagnostics.Contains("no normalizer"));

  diagnostics.clear();
  CHECK(ResolveAttributes(AttributeSpec::Uniform("NORM"), regex,
                          {"tagger", "normalizer"}, &attributes,
                          &diagnostics));
  CHECK(diagnostics.empty());
}

void TestUnsupportedAttribute() {
  RegexSet regex;
  regex.Add("dose", "\\d+mg");
  AttributeMap attributes;
  Diagnostics diagnostics;
  Status st = ResolveAttributes(AttributeSpec::PerLabel({{"dose", "LEMMA"}}),
                                regex, {}, &attributes, &diagnostics);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
  CHECK_EQ(attributes.size(), 0);

  st = ResolveAttributes(AttributeSpec::Uniform("SHAPE"), regex, {},
                         &attributes, &diagnostics);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestLabeledStrings();
  TestParseSpec();
  TestUniformAttribute();
  TestPerLabelAttributes();
  TestNormWithoutNormalizer();
  TestUnsupportedAttribute();

  std::cout << "PASS\n";
  return 0;
}
