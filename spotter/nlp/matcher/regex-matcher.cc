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

#include "spotter/nlp/matcher/regex-matcher.h"

#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/nlp/matcher/attributes.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

RegexMatcher::~RegexMatcher() {
  for (Pattern &pattern : patterns_) delete pattern.regex;
}

Status RegexMatcher::Add(const string &label,
                         const std::vector<string> &patterns,
                         TokenAttribute attribute) {
  RE2::Options options;
  options.set_log_errors(false);

  // Compile all patterns before adding any of them.
  std::vector<RE2 *> compiled;
  for (const string &pattern : patterns) {
    RE2 *regex = new RE2(pattern, options);
    if (!regex->ok()) {
      Status st(INVALID_ARGUMENT,
                "Invalid regular expression for " + label + " '" + pattern +
                "': " + regex->error());
      delete regex;
      for (RE2 *r : compiled) delete r;
      return st;
    }
    compiled.push_back(regex);
  }

  for (RE2 *regex : compiled) {
    patterns_.push_back({label, attribute, regex});
  }
  VLOG(1) << "Added " << compiled.size() << " patterns for " << label
          << " matching " << TokenAttributeName(attribute);
  return Status::OK;
}

void RegexMatcher::Match(const Document &document, int begin, int end,
                         std::vector<nlp::Match> *matches) const {
  if (begin >= end || patterns_.empty()) return;

  // Texts for the token range, built on demand for each attribute.
  string texts[2];
  std::vector<int> starts[2];
  std::vector<int> ends[2];
  bool built[2] = {false, false};

  for (const Pattern &pattern : patterns_) {
    int a = pattern.attribute;
    if (!built[a]) {
      texts[a] = document.AttributeText(begin, end, pattern.attribute,
                                        &starts[a]);
      for (int t = begin; t < end; ++t) {
        int size = document.token(t).Get(pattern.attribute).size();
        ends[a].push_back(starts[a][t - begin] + size);
      }
      built[a] = true;
    }
    Scan(pattern, texts[a], starts[a], ends[a], begin, matches);
  }
}

void RegexMatcher::Scan(const Pattern &pattern, const string &text,
                        const std::vector<int> &starts,
                        const std::vector<int> &ends, int begin,
                        std::vector<nlp::Match> *matches) const {
  re2::StringPiece input(text);
  re2::StringPiece m;
  size_t pos = 0;
  int n = starts.size();
  while (pos <= text.size()) {
    if (!pattern.regex->Match(input, pos, text.size(), RE2::UNANCHORED,
                              &m, 1)) {
      break;
    }
    int ms = m.data() - text.data();
    int me = ms + m.size();
    if (m.empty()) {
      // Skip empty match and continue at the next character.
      if (ms >= text.size()) break;
      pos = ms + UTF8::CharLen(text.data() + ms);
      continue;
    }
    pos = me;

    // Expand match to the tokens it overlaps.
    int tb = 0;
    while (tb < n && ends[tb] <= ms) tb++;
    int te = n;
    while (te > 0 && starts[te - 1] >= me) te--;
    if (tb < te) {
      matches->emplace_back(pattern.label, begin + tb, begin + te,
                            MATCH_REGEX);
    }
  }
}

}  // namespace nlp
}  // namespace spotter
