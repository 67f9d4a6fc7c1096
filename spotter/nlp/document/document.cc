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

#include "spotter/nlp/document/document.h"

#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"
#include "spotter/string/text.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

string Span::GetText() const {
  if (document_ == nullptr) return string();
  return document_->PhraseText(begin_, end_);
}

std::ostream &operator<<(std::ostream &out, const Span &span) {
  out << "[" << span.begin() << "," << span.end() << ") " << span.label();
  return out;
}

void Document::SetText(Text text) {
  text_ = text.str();
  tokens_.clear();
  spans_.clear();
}

void Document::AddToken(Text word, int begin, int end, BreakType brk) {
  Token token;
  token.begin_ = begin;
  token.end_ = end;
  token.word_ = word.str();
  UTF8::Lowercase(word.data(), word.size(), &token.norm_);
  token.brk_ = brk;
  tokens_.push_back(token);
}

void Document::SetNorm(int index, const string &norm) {
  DCHECK_GE(index, 0);
  DCHECK_LT(index, tokens_.size());
  tokens_[index].norm_ = norm;
}

string Document::PhraseText(int begin, int end) const {
  return AttributeText(begin, end, ATTR_TEXT);
}

string Document::AttributeText(int begin, int end, TokenAttribute attribute,
                               std::vector<int> *starts) const {
  string phrase;
  if (starts != nullptr) starts->clear();
  for (int t = begin; t < end; ++t) {
    const Token &token = tokens_[t];
    if (t > begin && token.brk() != NO_BREAK) phrase.push_back(' ');
    if (starts != nullptr) starts->push_back(phrase.size());
    phrase.append(token.Get(attribute));
  }
  return phrase;
}

void Document::GetSentence(int token, int *begin, int *end) const {
  DCHECK_GE(token, 0);
  DCHECK_LT(token, tokens_.size());
  int b = token;
  while (b > 0 && tokens_[b].brk() < SENTENCE_BREAK) b--;
  int e = token + 1;
  while (e < tokens_.size() && tokens_[e].brk() < SENTENCE_BREAK) e++;
  *begin = b;
  *end = e;
}

void Document::AddSpan(int begin, int end, const string &label) {
  CHECK_LE(0, begin);
  CHECK_LT(begin, end);
  CHECK_LE(end, tokens_.size());
  spans_.emplace_back(this, begin, end, label);
}

void Document::ReplaceSpans(const std::vector<Span> &spans) {
  std::vector<Span> replacement;
  replacement.reserve(spans.size());
  for (const Span &span : spans) {
    CHECK_LE(0, span.begin());
    CHECK_LT(span.begin(), span.end());
    CHECK_LE(span.end(), tokens_.size());
    replacement.emplace_back(this, span.begin(), span.end(), span.label());
  }
  spans_.swap(replacement);
}

}  // namespace nlp
}  // namespace spotter
