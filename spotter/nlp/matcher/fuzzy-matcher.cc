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

#include "spotter/nlp/matcher/fuzzy-matcher.h"

#include <algorithm>
#include <vector>

#include "spotter/base/logging.h"

namespace spotter {
namespace nlp {

double FuzzyRatio(const ustring &a, const ustring &b) {
  int n = a.size();
  int m = b.size();
  if (n + m == 0) return 100.0;

  // Length of the longest common subsequence. The indel distance is
  // n + m - 2 * lcs.
  std::vector<int> prev(m + 1, 0);
  std::vector<int> curr(m + 1, 0);
  for (int i = 1; i <= n; ++i) {
    for (int j = 1; j <= m; ++j) {
      if (a[i - 1] == b[j - 1]) {
        curr[j] = prev[j - 1] + 1;
      } else {
        curr[j] = std::max(prev[j], curr[j - 1]);
      }
    }
    prev.swap(curr);
  }
  int lcs = prev[m];
  return 200.0 * lcs / (n + m);
}

double FuzzyRatio(const string &a, const string &b) {
  ustring ua, ub;
  UTF8::DecodeString(a, &ua);
  UTF8::DecodeString(b, &ub);
  return FuzzyRatio(ua, ub);
}

void FuzzyMatcher::Prepare(const string &text, ustring *result) const {
  UTF8::DecodeString(text, result);
  if (options_.ignore_case) {
    for (char32 &c : *result) c = Unicode::ToLower(c);
  }
}

void FuzzyMatcher::Add(const string &label,
                       const std::vector<string> &tokens) {
  if (tokens.empty()) return;
  string text;
  for (int i = 0; i < tokens.size(); ++i) {
    if (i > 0) text.push_back(' ');
    text.append(tokens[i]);
  }
  Term term;
  term.label = label;
  term.length = tokens.size();
  Prepare(text, &term.text);
  terms_.push_back(term);
}

void FuzzyMatcher::Match(const Document &document, int begin, int end,
                         std::vector<nlp::Match> *matches) const {
  // Prepare document tokens in range.
  std::vector<ustring> tokens(end - begin);
  for (int t = begin; t < end; ++t) {
    Prepare(document.token(t).Get(attribute()), &tokens[t - begin]);
  }

  // Candidate window for a term.
  struct Candidate {
    int begin;
    int end;
    double ratio;
  };

  std::vector<nlp::Match> found;
  std::vector<Candidate> candidates;
  ustring window;
  for (const Term &term : terms_) {
    // Score all windows within the flex margin of the term length.
    candidates.clear();
    int shortest = std::max(1, term.length - options_.flex);
    int longest = term.length + options_.flex;
    for (int length = shortest; length <= longest; ++length) {
      for (int b = begin; b + length <= end; ++b) {
        window.clear();
        for (int t = b; t < b + length; ++t) {
          if (t > b) window.push_back(' ');
          const ustring &token = tokens[t - begin];
          window.insert(window.end(), token.begin(), token.end());
        }
        double ratio = FuzzyRatio(term.text, window);
        if (ratio >= options_.min_ratio) {
          candidates.push_back({b, b + length, ratio});
        }
      }
    }

    // Select best non-overlapping candidates.
    std::stable_sort(candidates.begin(), candidates.end(),
      [](const Candidate &a, const Candidate &b) {
        if (a.ratio != b.ratio) return a.ratio > b.ratio;
        return a.begin < b.begin;
      });
    int first = found.size();
    for (const Candidate &c : candidates) {
      bool overlaps = false;
      for (int i = first; i < found.size(); ++i) {
        if (c.begin < found[i].end && found[i].begin < c.end) {
          overlaps = true;
          break;
        }
      }
      if (!overlaps) {
        found.emplace_back(term.label, c.begin, c.end, MATCH_FUZZY, c.ratio);
      }
    }
  }

  // Order matches by position and remove duplicates. Terms are in label
  // registration order, so the stable sort keeps that order for equal
  // positions.
  std::stable_sort(found.begin(), found.end(),
    [](const nlp::Match &a, const nlp::Match &b) {
      if (a.begin != b.begin) return a.begin < b.begin;
      return a.end < b.end;
    });
  for (int i = 0; i < found.size(); ++i) {
    bool duplicate = false;
    for (int j = i - 1; j >= 0 && found[j].begin == found[i].begin &&
                        found[j].end == found[i].end; --j) {
      if (found[j].label == found[i].label) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) matches->push_back(found[i]);
  }
  VLOG(2) << "Fuzzy matching found " << found.size() << " candidates in ["
          << begin << "," << end << ")";
}

}  // namespace nlp
}  // namespace spotter
