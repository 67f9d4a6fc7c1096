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

#ifndef SPOTTER_NLP_MATCHER_MATCHER_CONFIG_H_
#define SPOTTER_NLP_MATCHER_MATCHER_CONFIG_H_

#include <string>
#include <utility>
#include <vector>

#include "spotter/base/status.h"
#include "spotter/base/types.h"

namespace spotter {
namespace nlp {

// Ordered mapping from label to an ordered list of strings. Labels are unique;
// adding strings to an existing label appends them to its list.
class LabeledStrings {
 public:
  struct Entry {
    string label;
    std::vector<string> values;
  };

  // Add a single string to a label.
  void Add(const string &label, const string &value);

  // Add list of strings to a label. An empty list still declares the label.
  void Add(const string &label, const std::vector<string> &values);

  // Returns the strings for a label, or null if the label is unknown.
  const std::vector<string> *Find(const string &label) const;

  // Check if label has been declared.
  bool Has(const string &label) const { return Find(label) != nullptr; }

  // Returns labels in declaration order.
  std::vector<string> labels() const;

  // Returns entries in label declaration order.
  const std::vector<Entry> &entries() const { return entries_; }

  // Number of labels.
  int size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Reads label/string pairs from a lexicon file. Each line has a label and a
  // string separated by a tab. Empty lines and lines starting with # are
  // skipped.
  Status Load(const string &filename);

 private:
  // Returns entry for label, adding a new one if needed.
  Entry *GetEntry(const string &label);

  std::vector<Entry> entries_;
};

// Vocabulary terms and regular expression patterns by label.
typedef LabeledStrings TermSet;
typedef LabeledStrings RegexSet;

// Attribute specification. Either one attribute name used for all labels, or
// attribute names for individual labels.
class AttributeSpec {
 public:
  // Default is the uniform TEXT attribute.
  AttributeSpec() : uniform_(true), value_("TEXT") {}

  // Uniform attribute for all labels.
  static AttributeSpec Uniform(const string &value);

  // Per-label attributes.
  static AttributeSpec PerLabel(
      const std::vector<std::pair<string, string>> &values);

  // Parses an attribute specification. A plain name, e.g. "NORM", is a
  // uniform specification. A comma-separated list of key=value pairs, e.g.
  // "term_attr=TEXT,dose=NORM", is a per-label specification.
  static Status Parse(const string &spec, AttributeSpec *result);

  // Add or replace the attribute for a label in a per-label specification.
  void Set(const string &label, const string &value);

  // Check for uniform specification.
  bool uniform() const { return uniform_; }

  // Attribute name for uniform specification.
  const string &value() const { return value_; }

  // Attribute names for per-label specification in the order they were set.
  const std::vector<std::pair<string, string>> &values() const {
    return values_;
  }

 private:
  bool uniform_;
  string value_;
  std::vector<std::pair<string, string>> values_;
};

// Options for approximate term matching.
struct FuzzyOptions {
  // Minimum similarity ratio on a 0-100 scale for a match.
  double min_ratio = 90.0;

  // Compare case-folded text.
  bool ignore_case = true;

  // Number of tokens a match may be shorter or longer than the term.
  int flex = 1;
};

// Configuration for the generic matcher.
struct MatcherConfig {
  // Vocabulary terms by label.
  TermSet terms;

  // Regular expressions by label.
  RegexSet regex;

  // Token attributes to match against.
  AttributeSpec attr;

  // Use approximate term matching instead of exact phrase matching.
  bool fuzzy = false;
  FuzzyOptions fuzzy_options;

  // Remove overlapping matches.
  bool filter_matches = true;

  // Only match in sentences containing existing spans.
  bool on_ents_only = false;
};

// Warnings collected while configuring a matcher.
class Diagnostics {
 public:
  // Add warning.
  void Warning(const string &message) { warnings_.push_back(message); }

  // Returns warnings in the order they were added.
  const std::vector<string> &warnings() const { return warnings_; }

  // Check if any of the warnings contains the text.
  bool Contains(const string &text) const;

  bool empty() const { return warnings_.empty(); }
  void clear() { warnings_.clear(); }

 private:
  std::vector<string> warnings_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_MATCHER_CONFIG_H_
