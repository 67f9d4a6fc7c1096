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

#include "spotter/nlp/document/phrase-tokenizer.h"

#include <string>
#include <vector>

#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"

namespace spotter {
namespace nlp {

void PhraseTokenizer::Tokenize(Text text, TokenAttribute attribute,
                               std::vector<string> *tokens) const {
  Document phrase;
  tokenizer_.Tokenize(&phrase, text);
  if (preprocessor_) preprocessor_(&phrase);

  tokens->clear();
  for (const Token &token : phrase.tokens()) {
    tokens->push_back(token.Get(attribute));
  }
}

}  // namespace nlp
}  // namespace spotter
