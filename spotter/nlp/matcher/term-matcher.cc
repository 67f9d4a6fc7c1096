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

#include "spotter/nlp/matcher/term-matcher.h"

namespace spotter {
namespace nlp {

const char *MatchSourceName(MatchSource source) {
  switch (source) {
    case MATCH_EXACT: return "exact";
    case MATCH_FUZZY: return "fuzzy";
    case MATCH_REGEX: return "regex";
  }
  return "?";
}

std::ostream &operator<<(std::ostream &out, const Match &match) {
  out << "[" << match.begin << "," << match.end << ") " << match.label
      << "/" << MatchSourceName(match.source);
  if (match.source == MATCH_FUZZY) out << " " << match.ratio;
  return out;
}

}  // namespace nlp
}  // namespace spotter
