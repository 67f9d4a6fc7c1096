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

#include "spotter/nlp/document/text-tokenizer.h"

#include <vector>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

namespace {

// Unicode character with its byte range in the source text.
struct Element {
  char32 ch;
  int begin;
  int end;
};

// Decodes text into elements. Bytes that are not valid UTF-8 become
// replacement characters.
void Decode(Text text, std::vector<Element> *elements) {
  const char *start = text.data();
  const char *end = start + text.size();
  const char *s = start;
  while (s < end) {
    char32 code = UTF8::Decode(s, end - s);
    int len = code < 0 ? 1 : UTF8::CharLen(s);
    if (code < 0) code = 0xFFFD;
    elements->push_back({code, static_cast<int>(s - start),
                         static_cast<int>(s - start) + len});
    s += len;
  }
}

bool IsEndOfSentence(char32 c) {
  return c == '.' || c == '!' || c == '?';
}

// Closing quotes and brackets that stay in the sentence they end.
bool IsClosing(char32 c) {
  return c == '"' || c == '\'' || c == ')' || c == ']' || c == '}' ||
         c == 0x2019 || c == 0x201D || c == 0xBB;
}

bool IsNumberPunctuation(char32 c) {
  return c == '.' || c == ',';
}

}  // namespace

void Tokenizer::Tokenize(Text text, const Callback &callback) const {
  std::vector<Element> elements;
  Decode(text, &elements);
  int n = elements.size();

  Token token;
  int i = 0;
  int newlines = 0;
  bool space = false;
  bool eos = false;
  bool first = true;
  while (i < n) {
    char32 c = elements[i].ch;

    // Whitespace only contributes to the break level of the next token.
    if (Unicode::IsSpace(c)) {
      if (Unicode::IsLineBreak(c)) newlines++;
      space = true;
      i++;
      continue;
    }

    // Find end of token.
    int j = i + 1;
    if (Unicode::IsLetterOrDigit(c)) {
      while (j < n) {
        char32 next = elements[j].ch;
        if (Unicode::IsLetterOrDigit(next)) {
          j++;
        } else if (IsNumberPunctuation(next) && j + 1 < n &&
                   Unicode::IsDigit(elements[j - 1].ch) &&
                   Unicode::IsDigit(elements[j + 1].ch)) {
          j += 2;
        } else {
          break;
        }
      }
    }

    // Determine break level from preceding whitespace.
    BreakType brk = NO_BREAK;
    if (newlines >= 2) {
      brk = PARAGRAPH_BREAK;
    } else if (newlines == 1) {
      brk = LINE_BREAK;
    } else if (space) {
      brk = SPACE_BREAK;
    }
    bool single = (j == i + 1);
    if (eos && !(single && (IsEndOfSentence(c) || IsClosing(c)))) {
      if (brk < SENTENCE_BREAK) brk = SENTENCE_BREAK;
      eos = false;
    }
    if (first) {
      brk = NO_BREAK;
      first = false;
    }
    if (single && IsEndOfSentence(c)) eos = true;

    // Emit token.
    token.begin = elements[i].begin;
    token.end = elements[j - 1].end;
    token.text.assign(text.data() + token.begin, token.end - token.begin);
    token.brk = brk;
    callback(token);

    newlines = 0;
    space = false;
    i = j;
  }
}

}  // namespace nlp
}  // namespace spotter
