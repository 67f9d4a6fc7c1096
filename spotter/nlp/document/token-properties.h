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

#ifndef SPOTTER_NLP_DOCUMENT_TOKEN_PROPERTIES_H_
#define SPOTTER_NLP_DOCUMENT_TOKEN_PROPERTIES_H_

namespace spotter {
namespace nlp {

// Token break types. The break level of a token is the strongest boundary
// between the token and the previous token.
enum BreakType {
  NO_BREAK         = 0,
  SPACE_BREAK      = 1,
  LINE_BREAK       = 2,
  SENTENCE_BREAK   = 3,
  PARAGRAPH_BREAK  = 4,
};

// Token attributes that matchers can match against.
enum TokenAttribute {
  ATTR_TEXT = 0,  // token text as it appears in the document
  ATTR_NORM = 1,  // normalized token text
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_DOCUMENT_TOKEN_PROPERTIES_H_
