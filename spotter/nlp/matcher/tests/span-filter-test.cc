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
#include <vector>

#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/nlp/matcher/span-filter.h"

using namespace spotter;
using namespace spotter::nlp;

void TestLongestWins() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "acetylsalicylic acid 100 mg tablet");

  std::vector<Span> spans;
  spans.emplace_back(&document, 1, 3, "short");
  spans.emplace_back(&document, 0, 3, "long");
  spans.emplace_back(&document, 3, 5, "form");
  FilterSpans(&spans);

  CHECK_EQ(spans.size(), 2);
  CHECK_EQ(spans[0], Span(&document, 0, 3, "long"));
  CHECK_EQ(spans[1], Span(&document, 3, 5, "form"));
}

void TestEqualLengthKeepsFirst() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "vitamin c daily");

  // Equal lengths are resolved by input order, not by position.
  std::vector<Span> spans;
  spans.emplace_back(&document, 1, 3, "second");
  spans.emplace_back(&document, 0, 2, "first");
  FilterSpans(&spans);
  CHECK_EQ(spans.size(), 1);
  CHECK_EQ(spans[0].label(), "second");

  // Identical ranges with different labels keep the first one.
  spans.clear();
  spans.emplace_back(&document, 0, 2, "drug");
  spans.emplace_back(&document, 0, 2, "supplement");
  FilterSpans(&spans);
  CHECK_EQ(spans.size(), 1);
  CHECK_EQ(spans[0].label(), "drug");
}

void TestSortedOutput() {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, "a b c d e f");

  std::vector<Span> spans;
  spans.emplace_back(&document, 4, 5, "e");
  spans.emplace_back(&document, 0, 1, "a");
  spans.emplace_back(&document, 2, 4, "cd");
  FilterSpans(&spans);
  CHECK_EQ(spans.size(), 3);
  CHECK_EQ(spans[0].label(), "a");
  CHECK_EQ(spans[1].label(), "cd");
  CHECK_EQ(spans[2].label(), "e");

  spans.clear();
  FilterSpans(&spans);
  CHECK(spans.empty());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestLongestWins();
  TestEqualLengthKeepsFirst();
  TestSortedOutput();

  std::cout << "PASS\n";
  return 0;
}
