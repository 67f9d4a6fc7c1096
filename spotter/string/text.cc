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

#include "spotter/string/text.h"

#include <string.h>
#include <algorithm>
#include <ostream>
#include <string>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"

namespace spotter {

const ssize_t Text::npos = -1;

static bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
         c == '\f' || c == '\v';
}

ssize_t Text::find(char c, ssize_t pos) const {
  if (length_ <= 0 || pos >= length_) return npos;
  const char *result =
    static_cast<const char *>(memchr(ptr_ + pos, c, length_ - pos));
  return result != nullptr ? result - ptr_ : npos;
}

Text Text::substr(ssize_t pos, ssize_t n) const {
  DCHECK_GE(pos, 0);
  if (pos > length_) pos = length_;
  if (n < 0 || n > length_ - pos) n = length_ - pos;
  return Text(ptr_ + pos, n);
}

Text Text::trim() const {
  ssize_t begin = 0;
  ssize_t end = length_;
  while (begin < end && IsAsciiSpace(ptr_[begin])) begin++;
  while (end > begin && IsAsciiSpace(ptr_[end - 1])) end--;
  return Text(ptr_ + begin, end - begin);
}

std::vector<Text> Text::split(char delimiter) const {
  std::vector<Text> parts;
  ssize_t start = 0;
  for (;;) {
    ssize_t pos = find(delimiter, start);
    if (pos == npos) {
      parts.push_back(substr(start));
      break;
    }
    parts.push_back(substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::ostream &operator <<(std::ostream &o, Text t) {
  o.write(t.data(), t.size());
  return o;
}

}  // namespace spotter
