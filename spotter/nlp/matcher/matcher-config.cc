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

#include "spotter/nlp/matcher/matcher-config.h"

#include <string>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/file/textmap.h"
#include "spotter/string/text.h"

namespace spotter {
namespace nlp {

LabeledStrings::Entry *LabeledStrings::GetEntry(const string &label) {
  for (Entry &entry : entries_) {
    if (entry.label == label) return &entry;
  }
  entries_.emplace_back();
  entries_.back().label = label;
  return &entries_.back();
}

void LabeledStrings::Add(const string &label, const string &value) {
  GetEntry(label)->values.push_back(value);
}

void LabeledStrings::Add(const string &label,
                         const std::vector<string> &values) {
  Entry *entry = GetEntry(label);
  entry->values.insert(entry->values.end(), values.begin(), values.end());
}

const std::vector<string> *LabeledStrings::Find(const string &label) const {
  for (const Entry &entry : entries_) {
    if (entry.label == label) return &entry.values;
  }
  return nullptr;
}

std::vector<string> LabeledStrings::labels() const {
  std::vector<string> result;
  for (const Entry &entry : entries_) result.push_back(entry.label);
  return result;
}

Status LabeledStrings::Load(const string &filename) {
  TextMapInput input(filename);
  int entries = 0;
  while (input.Next()) {
    const string &label = input.key();
    if (label.empty() || label[0] == '#') continue;
    if (input.value().empty()) {
      return Status(INVALID_ARGUMENT,
                    filename + ":" + std::to_string(input.line()) +
                    ": missing string for label " + label);
    }
    Add(label, input.value());
    entries++;
  }
  if (!input.status().ok()) return input.status();
  VLOG(1) << "Read " << entries << " entries from " << filename;
  return Status::OK;
}

AttributeSpec AttributeSpec::Uniform(const string &value) {
  AttributeSpec spec;
  spec.value_ = value;
  return spec;
}

AttributeSpec AttributeSpec::PerLabel(
    const std::vector<std::pair<string, string>> &values) {
  AttributeSpec spec;
  spec.uniform_ = false;
  spec.value_.clear();
  for (const auto &v : values) spec.Set(v.first, v.second);
  return spec;
}

void AttributeSpec::Set(const string &label, const string &value) {
  uniform_ = false;
  value_.clear();
  for (auto &v : values_) {
    if (v.first == label) {
      v.second = value;
      return;
    }
  }
  values_.emplace_back(label, value);
}

Status AttributeSpec::Parse(const string &spec, AttributeSpec *result) {
  Text text = Text(spec).trim();
  if (text.find('=') == Text::npos) {
    if (text.empty()) {
      return Status(INVALID_ARGUMENT, "Empty attribute specification");
    }
    *result = Uniform(text.str());
    return Status::OK;
  }

  std::vector<std::pair<string, string>> values;
  for (Text item : text.split(',')) {
    item = item.trim();
    if (item.empty()) continue;
    ssize_t eq = item.find('=');
    Text key = item.substr(0, eq == Text::npos ? item.size() : eq).trim();
    if (eq == Text::npos || key.empty()) {
      return Status(INVALID_ARGUMENT, "Invalid attribute specification", spec);
    }
    values.emplace_back(key.str(), item.substr(eq + 1).trim().str());
  }
  *result = PerLabel(values);
  return Status::OK;
}

bool Diagnostics::Contains(const string &text) const {
  for (const string &warning : warnings_) {
    if (warning.find(text) != string::npos) return true;
  }
  return false;
}

}  // namespace nlp
}  // namespace spotter
