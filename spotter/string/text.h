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

// Derived from Google StringPiece.

#ifndef SPOTTER_STRING_TEXT_H_
#define SPOTTER_STRING_TEXT_H_

#include <string.h>
#include <sys/types.h>
#include <iosfwd>
#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"

namespace spotter {

// Non-owning reference to a byte range, e.g. a part of the document text.
class Text {
 private:
  const char *ptr_;
  ssize_t length_;

 public:
  // Constructors.
  Text() : ptr_(nullptr), length_(0) {}
  Text(const char *str) : ptr_(str), length_(str ? strlen(str) : 0) {}
  Text(const string &str) : ptr_(str.data()), length_(str.size()) {}
  Text(const char *str, ssize_t len) : ptr_(str), length_(len) {}

  // Access to string buffer.
  const char *data() const { return ptr_; }
  ssize_t size() const { return length_; }
  ssize_t length() const { return length_; }
  bool empty() const { return length_ == 0; }

  // Index operator.
  char operator[](ssize_t index) const {
    DCHECK_GE(index, 0);
    DCHECK_LT(index, length_);
    return ptr_[index];
  }

  // Return text as string.
  string str() const {
    if (ptr_ == nullptr) return string();
    return string(data(), size());
  }

  // Iterators.
  typedef const char *const_iterator;
  const_iterator begin() const { return ptr_; }
  const_iterator end() const { return ptr_ + length_; }

  static const ssize_t npos;

  // Find character. Returns npos if not found.
  ssize_t find(char c, ssize_t pos = 0) const;

  // Substring. The length is pinned to the end of the text.
  Text substr(ssize_t pos, ssize_t n = npos) const;

  // Return text with leading and trailing ASCII whitespace removed.
  Text trim() const;

  // Split text on delimiter. Empty parts are kept.
  std::vector<Text> split(char delimiter) const;
};

// Comparison operators.
inline bool operator ==(Text x, Text y) {
  return x.size() == y.size() && memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator !=(Text x, Text y) {
  return !(x == y);
}

// Allow text to be streamed.
extern std::ostream &operator <<(std::ostream &o, Text t);

}  // namespace spotter

#endif  // SPOTTER_STRING_TEXT_H_
