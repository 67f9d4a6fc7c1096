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

#include "spotter/nlp/matcher/span-filter.h"

#include <algorithm>
#include <vector>

namespace spotter {
namespace nlp {

void FilterSpans(std::vector<Span> *spans) {
  std::vector<Span> sorted(*spans);
  std::stable_sort(sorted.begin(), sorted.end(),
    [](const Span &a, const Span &b) {
      return a.length() > b.length();
    });

  // Tokens covered by accepted spans.
  int limit = 0;
  for (const Span &span : sorted) limit = std::max(limit, span.end());
  std::vector<bool> covered(limit, false);

  std::vector<Span> accepted;
  for (const Span &span : sorted) {
    bool free = true;
    for (int t = span.begin(); t < span.end(); ++t) {
      if (covered[t]) {
        free = false;
        break;
      }
    }
    if (!free) continue;
    for (int t = span.begin(); t < span.end(); ++t) covered[t] = true;
    accepted.push_back(span);
  }

  std::stable_sort(accepted.begin(), accepted.end(),
    [](const Span &a, const Span &b) {
      return a.begin() < b.begin();
    });
  spans->swap(accepted);
}

}  // namespace nlp
}  // namespace spotter
