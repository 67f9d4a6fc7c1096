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

#include "spotter/nlp/document/annotator.h"

#include <errno.h>
#include <stdlib.h>
#include <string>

#include "spotter/base/logging.h"

REGISTER_COMPONENT_REGISTRY("document annotator", spotter::nlp::Annotator);

namespace spotter {
namespace nlp {

void AnnotatorConfig::Set(const string &name, const string &value) {
  for (Parameter &p : parameters_) {
    if (p.name == name) {
      p.value = value;
      return;
    }
  }
  parameters_.push_back({name, value});
}

void AnnotatorConfig::Set(const string &name, int32 value) {
  Set(name, std::to_string(value));
}

void AnnotatorConfig::Set(const string &name, double value) {
  Set(name, std::to_string(value));
}

void AnnotatorConfig::Set(const string &name, bool value) {
  Set(name, string(value ? "true" : "false"));
}

const string *AnnotatorConfig::Find(const string &name) const {
  for (const Parameter &p : parameters_) {
    if (p.name == name) return &p.value;
  }
  return nullptr;
}

bool AnnotatorConfig::Has(const string &name) const {
  return Find(name) != nullptr;
}

const string &AnnotatorConfig::Get(const string &name,
                                   const string &defval) const {
  const string *value = Find(name);
  return value != nullptr ? *value : defval;
}

string AnnotatorConfig::Get(const string &name, const char *defval) const {
  const string *value = Find(name);
  return value != nullptr ? *value : defval;
}

Status AnnotatorConfig::Get(const string &name, int32 defval,
                            int32 *value) const {
  const string *str = Find(name);
  if (str == nullptr || str->empty()) {
    *value = defval;
    return Status::OK;
  }
  char *end;
  errno = 0;
  long v = strtol(str->c_str(), &end, 10);
  if (*end != 0 || errno != 0 || v < INT32_MIN || v > INT32_MAX) {
    return Status(INVALID_ARGUMENT,
                  "Invalid integer for parameter " + name + ": " + *str);
  }
  *value = v;
  return Status::OK;
}

Status AnnotatorConfig::Get(const string &name, double defval,
                            double *value) const {
  const string *str = Find(name);
  if (str == nullptr || str->empty()) {
    *value = defval;
    return Status::OK;
  }
  char *end;
  errno = 0;
  double v = strtod(str->c_str(), &end);
  if (*end != 0 || errno != 0) {
    return Status(INVALID_ARGUMENT,
                  "Invalid number for parameter " + name + ": " + *str);
  }
  *value = v;
  return Status::OK;
}

Status AnnotatorConfig::Get(const string &name, bool defval,
                            bool *value) const {
  const string *str = Find(name);
  if (str == nullptr || str->empty()) {
    *value = defval;
  } else if (*str == "true" || *str == "1") {
    *value = true;
  } else if (*str == "false" || *str == "0") {
    *value = false;
  } else {
    return Status(INVALID_ARGUMENT,
                  "Invalid boolean for parameter " + name + ": " + *str);
  }
  return Status::OK;
}

std::vector<string> AnnotatorConfig::names() const {
  std::vector<string> result;
  for (const Parameter &p : parameters_) result.push_back(p.name);
  return result;
}

Status Annotator::Init(const AnnotatorConfig &config,
                       const Pipeline &upstream) {
  return Status::OK;
}

Pipeline::~Pipeline() {
  for (Annotator *a : annotators_) delete a;
}

Status Pipeline::Add(const string &type, const AnnotatorConfig &config) {
  if (!Annotator::Registered(type)) {
    return Status(NOT_FOUND, "Unknown annotator", type);
  }
  Annotator *annotator = Annotator::Create(type);
  Status st = annotator->Init(config, *this);
  if (!st.ok()) {
    delete annotator;
    return st;
  }
  VLOG(1) << "Added " << type << " annotator to pipeline";
  annotators_.push_back(annotator);
  names_.push_back(type);
  return Status::OK;
}

void Pipeline::Annotate(Document *document) const {
  for (Annotator *a : annotators_) a->Annotate(document);
}

}  // namespace nlp
}  // namespace spotter
