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

#ifndef SPOTTER_NLP_MATCHER_ATTRIBUTES_H_
#define SPOTTER_NLP_MATCHER_ATTRIBUTES_H_

#include <string>
#include <utility>
#include <vector>

#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/nlp/document/token-properties.h"
#include "spotter/nlp/matcher/matcher-config.h"

namespace spotter {
namespace nlp {

// Reserved attribute key for the attribute used by term matching.
extern const char kTermAttribute[];

// Attribute for labels missing from a per-label specification.
extern const char kDefaultAttribute[];

// Name of the pipeline stage that produces normalized token text.
extern const char kNormalizerStage[];

// Parses attribute name. TEXT and NORM (or NORMALIZED) are accepted in any
// case. Returns false for other names.
bool ParseTokenAttribute(const string &name, TokenAttribute *attribute);

// Returns canonical name for attribute.
const char *TokenAttributeName(TokenAttribute attribute);

// Resolved token attribute for each regex label and for term matching.
class AttributeMap {
 public:
  // Set attribute for key.
  void Set(const string &key, TokenAttribute attribute);

  // Check if key has an attribute.
  bool Has(const string &key) const;

  // Returns attribute for key. The key must be in the map.
  TokenAttribute Get(const string &key) const;

  // Returns attribute for term matching.
  TokenAttribute term_attribute() const { return Get(kTermAttribute); }

  // Check if any key uses the attribute.
  bool Uses(TokenAttribute attribute) const;

  // Entries in the order keys were added.
  const std::vector<std::pair<string, TokenAttribute>> &entries() const {
    return entries_;
  }

  int size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

 private:
  std::vector<std::pair<string, TokenAttribute>> entries_;
};

// Resolves the attribute specification into an attribute map with an entry
// for every regex label and the term attribute key. A uniform specification is
// used for all keys. With a per-label specification, the values are
// upper-cased, and keys that are missing get the default NORM attribute. Keys
// that are neither regex labels nor the term attribute key are ignored with a
// warning. A warning is also added if the normalized attribute is used and
// there is no normalizer in the pipeline. Returns INVALID_ARGUMENT if an
// attribute is not supported, in which case the map is left empty.
Status ResolveAttributes(const AttributeSpec &spec, const RegexSet &regex,
                         const std::vector<string> &pipe_names,
                         AttributeMap *attributes, Diagnostics *diagnostics);

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_ATTRIBUTES_H_
