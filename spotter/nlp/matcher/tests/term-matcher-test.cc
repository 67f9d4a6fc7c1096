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

#include <math.h>
#include <iostream>
#include <string>
#include <vector>

#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/nlp/matcher/fuzzy-matcher.h"
#include "spotter/nlp/matcher/matcher-config.h"
#include "spotter/nlp/matcher/phrase-matcher.h"
#include "spotter/nlp/matcher/term-matcher.h"

using namespace spotter;
using namespace spotter::nlp;

void TestPhraseMatcher() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Patient takes aspirin daily");

  PhraseMatcher matcher(ATTR_TEXT);
  matcher.Add("drug", {"aspirin"});
  matcher.Add("drug", {"aspirin"});
  matcher.Add("drug", {"paracetamol"});
  CHECK_EQ(matcher.size(), 2);
  CHECK_EQ(matcher.source(), MATCH_EXACT);

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 1);
  CHECK_EQ(matches[0], Match("drug", 2, 3, MATCH_EXACT));

  // Matching is restricted to the token range.
  matches.clear();
  matcher.Match(document, 0, 2, &matches);
  CHECK(matches.empty());

  // Matching is case-sensitive on the token text.
  tokenizer.Tokenize(&document, "ASPIRIN");
  matcher.Match(document, 0, document.length(), &matches);
  CHECK(matches.empty());
}

void TestMultiTokenPhrases() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Given vitamin c and vitamin d");

  PhraseMatcher matcher(ATTR_NORM);
  matcher.Add("vitamin", {"vitamin"});
  matcher.Add("supplement", {"vitamin", "c"});
  matcher.Add("nutrient", {"vitamin", "c"});
  matcher.Add("supplement", {"vitamin", "d"});

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 5);
  CHECK_EQ(matches[0], Match("vitamin", 1, 2, MATCH_EXACT));
  CHECK_EQ(matches[1], Match("supplement", 1, 3, MATCH_EXACT));
  CHECK_EQ(matches[2], Match("nutrient", 1, 3, MATCH_EXACT));
  CHECK_EQ(matches[3], Match("vitamin", 4, 5, MATCH_EXACT));
  CHECK_EQ(matches[4], Match("supplement", 4, 6, MATCH_EXACT));
  CHECK_EQ(matcher.labels().size(), 3);
  CHECK_EQ(matcher.labels().Find("nutrient"), 2);
  CHECK_EQ(matcher.labels().Find("mineral"), -1);
}

void TestFuzzyRatio() {
  CHECK_EQ(FuzzyRatio("aspirin", "aspirin"), 100.0);
  CHECK_EQ(FuzzyRatio("", ""), 100.0);
  CHECK_EQ(FuzzyRatio("abc", ""), 0.0);
  CHECK(fabs(FuzzyRatio("asprin", "aspirin") - 92.3077) < 0.001);
  CHECK(fabs(FuzzyRatio("café", "cafe") - 75.0) < 0.001);
}

void TestFuzzyMatcher() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "Patient takes Asprin daily");

  FuzzyOptions options;
  options.min_ratio = 90.0;
  FuzzyMatcher matcher(ATTR_TEXT, options);
  matcher.Add("aspirin", {"aspirin"});
  CHECK_EQ(matcher.source(), MATCH_FUZZY);
  CHECK_EQ(matcher.options().flex, 1);
  CHECK(matcher.options().ignore_case);

  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 1);
  CHECK_EQ(matches[0], Match("aspirin", 2, 3, MATCH_FUZZY));
  CHECK_GT(matches[0].ratio, 90.0);
  CHECK_LT(matches[0].ratio, 99.0);

  // Raising the threshold removes the match.
  options.min_ratio = 99.0;
  FuzzyMatcher strict(ATTR_TEXT, options);
  strict.Add("aspirin", {"aspirin"});
  matches.clear();
  strict.Match(document, 0, document.length(), &matches);
  CHECK(matches.empty());

  // Case is significant unless ignored.
  options.min_ratio = 90.0;
  options.ignore_case = false;
  FuzzyMatcher cased(ATTR_TEXT, options);
  cased.Add("aspirin", {"aspirin"});
  cased.Match(document, 0, document.length(), &matches);
  CHECK(matches.empty());
}

void TestFuzzyWindows() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "acetylsalicylic acid or acetylsalicylic acd");

  FuzzyOptions options;
  FuzzyMatcher matcher(ATTR_TEXT, options);
  matcher.Add("drug", {"acetylsalicylic", "acid"});

  // Each occurrence is matched once with its best window.
  std::vector<Match> matches;
  matcher.Match(document, 0, document.length(), &matches);
  CHECK_EQ(matches.size(), 2);
  CHECK_EQ(matches[0].begin, 0);
  CHECK_EQ(matches[0].end, 2);
  CHECK_EQ(matches[0].ratio, 100.0);
  CHECK_EQ(matches[1].begin, 3);
  CHECK_EQ(matches[1].end, 5);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestPhraseMatcher();
  TestMultiTokenPhrases();
  TestFuzzyRatio();
  TestFuzzyMatcher();
  TestFuzzyWindows();

  std::cout << "PASS\n";
  return 0;
}
