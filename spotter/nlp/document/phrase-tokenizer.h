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

#ifndef SPOTTER_NLP_DOCUMENT_PHRASE_TOKENIZER_H_
#define SPOTTER_NLP_DOCUMENT_PHRASE_TOKENIZER_H_

#include <functional>
#include <string>
#include <vector>

#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/string/text.h"

namespace spotter {
namespace nlp {

// Tokenizes phrases, e.g. vocabulary terms, the same way documents are
// tokenized so phrase tokens can be compared with document tokens.
class PhraseTokenizer {
 public:
  // Preprocessing applied to the phrase document before the token attributes
  // are extracted, e.g. running the upstream annotators.
  typedef std::function<void(Document *document)> Preprocessor;

  // Tokenize phrase into token words.
  void Tokenize(Text text, std::vector<string> *tokens) const {
    Tokenize(text, ATTR_TEXT, tokens);
  }

  // Tokenize phrase and return the attribute text for each token.
  void Tokenize(Text text, TokenAttribute attribute,
                std::vector<string> *tokens) const;

  // Set preprocessor for phrases.
  void set_preprocessor(const Preprocessor &preprocessor) {
    preprocessor_ = preprocessor;
  }

 private:
  // Document tokenizer.
  DocumentTokenizer tokenizer_;

  // Optional phrase preprocessor.
  Preprocessor preprocessor_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_DOCUMENT_PHRASE_TOKENIZER_H_
