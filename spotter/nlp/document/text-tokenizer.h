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

#ifndef SPOTTER_NLP_DOCUMENT_TEXT_TOKENIZER_H_
#define SPOTTER_NLP_DOCUMENT_TEXT_TOKENIZER_H_

#include <functional>
#include <string>

#include "spotter/base/macros.h"
#include "spotter/base/types.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/string/text.h"

namespace spotter {
namespace nlp {

// Tokenizer for breaking text into tokens and sentences. Runs of letters and
// digits form word tokens, where a period or comma between two digits is
// part of the number. All other characters except whitespace are tokens of
// their own. The break level of a token is determined by the whitespace in
// front of it; two or more newlines start a new paragraph. A sentence ends
// after a period, exclamation mark, or question mark, including any closing
// quotes or brackets following it.
class Tokenizer {
 public:
  // Tokens generated by tokenizer.
  struct Token {
    string text;
    BreakType brk;
    int begin;
    int end;
  };

  // Callback for collecting the generated tokens.
  typedef std::function<void(const Token &token)> Callback;

  Tokenizer() = default;

  // Tokenizes text into sentences with tokens.
  void Tokenize(Text text, const Callback &callback) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(Tokenizer);
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_DOCUMENT_TEXT_TOKENIZER_H_
