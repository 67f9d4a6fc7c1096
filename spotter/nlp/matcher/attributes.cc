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

#include "spotter/nlp/matcher/attributes.h"

#include <algorithm>
#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

const char kTermAttribute[] = "term_attr";
const char kDefaultAttribute[] = "NORM";
const char kNormalizerStage[] = "normalizer";

bool ParseTokenAttribute(const string &name, TokenAttribute *attribute) {
  string upper = UTF8::Upper(name);
  if (upper == "TEXT") {
    *attribute = ATTR_TEXT;
  } else if (upper == "NORM" || upper == "NORMALIZED") {
    *attribute = ATTR_NORM;
  } else {
    return false;
  }
  return true;
}

const char *TokenAttributeName(TokenAttribute attribute) {
  switch (attribute) {
    case ATTR_TEXT: return "TEXT";
    case ATTR_NORM: return "NORM";
  }
  return "?";
}

void AttributeMap::Set(const string &key, TokenAttribute attribute) {
  for (auto &entry : entries_) {
    if (entry.first == key) {
      entry.second = attribute;
      return;
    }
  }
  entries_.emplace_back(key, attribute);
}

bool AttributeMap::Has(const string &key) const {
  for (const auto &entry : entries_) {
    if (entry.first == key) return true;
  }
  return false;
}

TokenAttribute AttributeMap::Get(const string &key) const {
  for (const auto &entry : entries_) {
    if (entry.first == key) return entry.second;
  }
  LOG(FATAL) << "No attribute for " << key;
  return ATTR_TEXT;
}

bool AttributeMap::Uses(TokenAttribute attribute) const {
  for (const auto &entry : entries_) {
    if (entry.second == attribute) return true;
  }
  return false;
}

Status ResolveAttributes(const AttributeSpec &spec, const RegexSet &regex,
                         const std::vector<string> &pipe_names,
                         AttributeMap *attributes, Diagnostics *diagnostics) {
  attributes->clear();

  // Keys that need an attribute.
  std::vector<string> keys = regex.labels();
  keys.push_back(kTermAttribute);

  // Collect attribute names for all keys.
  std::vector<std::pair<string, string>> names;
  if (spec.uniform()) {
    for (const string &key : keys) names.emplace_back(key, spec.value());
  } else {
    const auto &values = spec.values();
    for (const string &key : keys) {
      string name = kDefaultAttribute;
      for (const auto &v : values) {
        if (v.first == key) name = UTF8::Upper(v.second);
      }
      names.emplace_back(key, name);
    }
    for (const auto &v : values) {
      if (std::find(keys.begin(), keys.end(), v.first) == keys.end()) {
        diagnostics->Warning("Attribute for " + v.first +
                             " is not for a regex label and is ignored");
      }
    }
  }

  // Check that all attributes are supported.
  AttributeMap resolved;
  for (const auto &n : names) {
    TokenAttribute attribute;
    if (!ParseTokenAttribute(n.second, &attribute)) {
      return Status(INVALID_ARGUMENT,
                    "Unsupported attribute " + n.second + " for " + n.first);
    }
    resolved.Set(n.first, attribute);
  }

  // Normalized token text is only meaningful after normalization.
  bool normalizer = std::find(pipe_names.begin(), pipe_names.end(),
                              kNormalizerStage) != pipe_names.end();
  if (resolved.Uses(ATTR_NORM) && !normalizer) {
    diagnostics->Warning(
        "The NORM attribute is used but there is no normalizer in the "
        "pipeline");
  }

  *attributes = resolved;
  return Status::OK;
}

}  // namespace nlp
}  // namespace spotter
