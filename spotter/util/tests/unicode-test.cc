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
#include "spotter/base/types.h"
#include "spotter/util/fingerprint.h"
#include "spotter/util/unicode.h"

using namespace spotter;

void TestNormalization() {
  string norm;
  UTF8::Normalize("Café Über", NORMALIZE_DEFAULT, &norm);
  CHECK_EQ(norm, "cafe uber");

  UTF8::Normalize("Café", NORMALIZE_CASE, &norm);
  CHECK_EQ(norm, "café");

  UTF8::Normalize("Dose 250", NORMALIZE_DIGITS, &norm);
  CHECK_EQ(norm, "Dose 999");

  CHECK_EQ(UTF8::Lower("ASPIRIN"), "aspirin");
  CHECK_EQ(UTF8::Upper("norm"), "NORM");
  CHECK_EQ(UTF8::Length("café"), 4);
}

void TestParseNormalization() {
  Normalization normalization;
  CHECK(ParseNormalization("cl", &normalization));
  CHECK_EQ(normalization, NORMALIZE_DEFAULT);
  CHECK_EQ(NormalizationString(normalization), "cl");

  CHECK(ParseNormalization("", &normalization));
  CHECK_EQ(normalization, NORMALIZE_NONE);

  Status st = ParseNormalization("cx", &normalization);
  CHECK(!st.ok());
  CHECK_EQ(st.code(), INVALID_ARGUMENT);
}

void TestDecode() {
  ustring text;
  UTF8::DecodeString("aé", &text);
  CHECK_EQ(text.size(), 2);
  CHECK_EQ(text[0], 'a');
  CHECK_EQ(text[1], 0xE9);

  // Invalid bytes become replacement characters.
  UTF8::DecodeString(string("a\xff" "b"), &text);
  CHECK_EQ(text.size(), 3);
  CHECK_EQ(text[1], 0xFFFD);
}

void TestPhraseFingerprint() {
  std::vector<string> ab = {"vitamin", "c"};
  std::vector<string> ba = {"c", "vitamin"};
  std::vector<string> joined = {"vitaminc"};
  CHECK_EQ(PhraseFingerprint(ab), PhraseFingerprint(ab));
  CHECK_NE(PhraseFingerprint(ab), PhraseFingerprint(ba));
  CHECK_NE(PhraseFingerprint(ab), PhraseFingerprint(joined));
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestNormalization();
  TestParseNormalization();
  TestDecode();
  TestPhraseFingerprint();

  std::cout << "PASS\n";
  return 0;
}
