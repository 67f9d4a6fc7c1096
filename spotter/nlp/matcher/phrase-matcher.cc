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

#include "spotter/nlp/matcher/phrase-matcher.h"

#include <algorithm>

#include "spotter/base/logging.h"
#include "spotter/util/fingerprint.h"

namespace spotter {
namespace nlp {

void PhraseMatcher::Add(const string &label,
                        const std::vector<string> &tokens) {
  if (tokens.empty()) return;
  int id = labels_.Add(label);

  // Skip duplicate phrases for the same label.
  std::vector<Phrase> &bucket = phrases_[PhraseFingerprint(tokens)];
  for (const Phrase &phrase : bucket) {
    if (phrase.label == id && phrase.tokens == tokens) return;
  }
  bucket.push_back({id, tokens});

  max_length_ = std::max(max_length_, static_cast<int>(tokens.size()));
  size_++;
}

void PhraseMatcher::Match(const Document &document, int begin, int end,
                          std::vector<nlp::Match> *matches) const {
  TokenAttribute attr = attribute();
  std::vector<int> ids;
  for (int b = begin; b < end; ++b) {
    uint64 fp = 1;
    int limit = std::min(end, b + max_length_);
    for (int e = b + 1; e <= limit; ++e) {
      fp = FingerprintCat(fp, Fingerprint(document.token(e - 1).Get(attr)));
      auto f = phrases_.find(fp);
      if (f == phrases_.end()) continue;

      // Verify candidates and collect the labels of matching phrases.
      ids.clear();
      for (const Phrase &phrase : f->second) {
        if (phrase.tokens.size() != e - b) continue;
        bool same = true;
        for (int i = 0; same && i < phrase.tokens.size(); ++i) {
          same = phrase.tokens[i] == document.token(b + i).Get(attr);
        }
        if (same) ids.push_back(phrase.label);
      }

      // Report matches in label registration order.
      std::sort(ids.begin(), ids.end());
      ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
      for (int id : ids) {
        matches->emplace_back(labels_.Lookup(id), b, e, MATCH_EXACT);
      }
    }
  }
}

}  // namespace nlp
}  // namespace spotter
