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

#ifndef SPOTTER_NLP_DOCUMENT_DOCUMENT_H_
#define SPOTTER_NLP_DOCUMENT_DOCUMENT_H_

#include <ostream>
#include <string>
#include <vector>

#include "spotter/base/macros.h"
#include "spotter/base/types.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/string/text.h"

namespace spotter {
namespace nlp {

class Document;

// A token represents a range of characters in the document text. A token is a
// word or any other kind of lexical unit like punctuation, number, etc.
class Token {
 public:
  // Text span for token in document text. The [begin;end[ is a semi-open byte
  // range of the UTF-8 encoded token in the document text.
  int begin() const { return begin_; }
  int end() const { return end_; }

  // Token word.
  const string &word() const { return word_; }

  // Normalized token word. Defaults to the lowercased word.
  const string &norm() const { return norm_; }

  // Returns token text for attribute.
  const string &Get(TokenAttribute attribute) const {
    return attribute == ATTR_NORM ? norm_ : word_;
  }

  // Break level before token.
  BreakType brk() const { return brk_; }

 private:
  int begin_;       // first byte position of token
  int end_;         // first byte position after token
  string word_;     // token word
  string norm_;     // normalized token word
  BreakType brk_;   // break level before token

  friend class Document;
};

// A span is a labeled range of tokens in a document. The span covers the
// tokens in the half-open interval [begin;end[.
class Span {
 public:
  Span() : document_(nullptr), begin_(0), end_(0) {}
  Span(const Document *document, int begin, int end, const string &label)
      : document_(document), begin_(begin), end_(end), label_(label) {}

  // Returns the document that the span belongs to.
  const Document *document() const { return document_; }

  // Returns the begin and end token.
  int begin() const { return begin_; }
  int end() const { return end_; }

  // Returns the length of the span in number of tokens.
  int length() const { return end_ - begin_; }

  // Returns span label.
  const string &label() const { return label_; }

  // Returns text for span.
  string GetText() const;

  // Returns true if the two spans share at least one token.
  bool Overlaps(const Span &other) const {
    return begin_ < other.end_ && other.begin_ < end_;
  }

  bool operator==(const Span &other) const {
    return document_ == other.document_ && begin_ == other.begin_ &&
           end_ == other.end_ && label_ == other.label_;
  }
  bool operator!=(const Span &other) const { return !(*this == other); }

 private:
  const Document *document_;
  int begin_;
  int end_;
  string label_;
};

// Output span as [begin,end) label.
std::ostream &operator<<(std::ostream &out, const Span &span);

// A document holds the text, the tokens, and an ordered list of span
// annotations. Overlapping annotations are allowed; it is up to the annotators
// to resolve overlaps if needed.
class Document {
 public:
  Document() = default;

  // Return the document text.
  const string &text() const { return text_; }

  // Set document text. This will delete all existing tokens and spans.
  void SetText(Text text);

  // Add token to document. If begin and end are not specified the token is
  // not anchored in the document text.
  void AddToken(Text word, int begin = -1, int end = -1,
                BreakType brk = SPACE_BREAK);

  // Set normalized text for token.
  void SetNorm(int index, const string &norm);

  // Return the number of tokens in the document.
  int length() const { return tokens_.size(); }

  // Return token in the document.
  const Token &token(int index) const { return tokens_[index]; }

  // Return document tokens.
  const std::vector<Token> &tokens() const { return tokens_; }

  // Returns the raw text for the phrase [begin, end). Tokens are separated by
  // a space unless there is no break between them.
  string PhraseText(int begin, int end) const;

  // Returns the text of an attribute for [begin, end), joined the same way as
  // PhraseText. If starts is not null it receives the byte offset of each
  // token in the returned string.
  string AttributeText(int begin, int end, TokenAttribute attribute,
                       std::vector<int> *starts = nullptr) const;

  // Returns the sentence [begin, end) containing the token.
  void GetSentence(int token, int *begin, int *end) const;

  // Add span annotation to the end of the span list.
  void AddSpan(int begin, int end, const string &label);

  // Replace all span annotations.
  void ReplaceSpans(const std::vector<Span> &spans);

  // Returns the number of spans in the document.
  int num_spans() const { return spans_.size(); }

  // Return span in document.
  const Span &span(int index) const { return spans_[index]; }

  // Return all spans in document.
  const std::vector<Span> &spans() const { return spans_; }

 private:
  // Document text.
  string text_;

  // Document tokens.
  std::vector<Token> tokens_;

  // Span annotations.
  std::vector<Span> spans_;

  DISALLOW_COPY_AND_ASSIGN(Document);
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_DOCUMENT_DOCUMENT_H_
