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
#include "spotter/nlp/document/annotator.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/nlp/matcher/regex-matcher.h"
#include "spotter/nlp/matcher/term-matcher.h"

using namespace spotter;
using namespace spotter::nlp;

void TestDose() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Take 50mg now");

  RegexMatcher matcher;
  CHECK(matcher.Add("dose", {"\\d+mg"}, ATTR_TEXT));
  CHECK_EQ(matcher.size(), 1);

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 1);
  CHECK_EQ(matches[0], Match("dose", 1, 2, MATCH_REGEX));
  CHECK_EQ(document.PhraseText(matches[0].begin, matches[0].end), "50mg");
}

void TestTokenExpansion() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Take 50mg twice per day");

  // Partial token matches cover the whole token.
  RegexMatcher matcher;
  CHECK(matcher.Add("number", {"\\d+"}, ATTR_TEXT));
  CHECK(matcher.Add("frequency", {"ce per d"}, ATTR_TEXT));

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 2);
  CHECK_EQ(matches[0], Match("number", 1, 2, MATCH_REGEX));
  CHECK_EQ(matches[1], Match("frequency", 2, 5, MATCH_REGEX));

  // Matches are found within the token range only.
  matches.clear();
  matcher.Match(document, 2, document.length(), &matches);
  CHECK_EQ(matches.size(), 1);
  CHECK_EQ(matches[0].label, "frequency");
}

void TestEmptyMatches() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "no dose given");

  RegexMatcher matcher;
  CHECK(matcher.Add("empty", {"x*", "^"}, ATTR_TEXT));
  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK(matches.empty());
}

void TestNormAttribute() {
  Pipeline pipeline;
  CHECK(pipeline.Add("normalizer"));
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Prescribed PARACÉTAMOL and Aspirin");
  pipeline.Annotate(&document);

  RegexMatcher matcher;
  CHECK(matcher.Add("drug", {"paracetamol"}, ATTR_NORM));
  CHECK(matcher.Add("brand", {"Aspirin"}, ATTR_TEXT));
  CHECK(matcher.Add("lower", {"aspirin"}, ATTR_TEXT));

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 2);
  CHECK_EQ(matches[0], Match("drug", 1, 2, MATCH_REGEX));
  CHECK_EQ(matches[1], Match("brand", 3, 4, MATCH_REGEX));
}

void TestInvalidPattern() {
  RegexMatcher matcher;
  Status st = matcher.Add("dose", {"\\d+mg", "(unclosed"}, ATTR_TEXT);
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
  CHECK(string(st.message()).find("dose") != string::npos);
  CHECK_EQ(matcher.size(), 0);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestDose();
  TestTokenExpansion();
  TestEmptyMatches();
  TestNormAttribute();
  TestInvalidPattern();

  std::cout << "PASS\n";
  return 0;
}
