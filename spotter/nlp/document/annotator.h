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

#ifndef SPOTTER_NLP_DOCUMENT_ANNOTATOR_H_
#define SPOTTER_NLP_DOCUMENT_ANNOTATOR_H_

#include <string>
#include <vector>

#include "spotter/base/registry.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/nlp/document/document.h"

namespace spotter {
namespace nlp {

class Pipeline;

// Annotator parameters. Parameters are name/value string pairs that are
// converted to the requested type on access.
class AnnotatorConfig {
 public:
  // Set parameter value, replacing any existing value.
  void Set(const string &name, const string &value);
  void Set(const string &name, const char *value) { Set(name, string(value)); }
  void Set(const string &name, int32 value);
  void Set(const string &name, double value);
  void Set(const string &name, bool value);

  // Check if parameter has been set.
  bool Has(const string &name) const;

  // Get string parameter value.
  const string &Get(const string &name, const string &defval) const;
  string Get(const string &name, const char *defval) const;

  // Get typed parameter value. Returns INVALID_ARGUMENT if the parameter
  // value cannot be converted.
  Status Get(const string &name, int32 defval, int32 *value) const;
  Status Get(const string &name, double defval, double *value) const;
  Status Get(const string &name, bool defval, bool *value) const;

  // Parameter names in the order they were first set.
  std::vector<string> names() const;

 private:
  struct Parameter {
    string name;
    string value;
  };

  // Find parameter value. Returns null if not set.
  const string *Find(const string &name) const;

  std::vector<Parameter> parameters_;
};

// Document annotation component interface.
class Annotator : public Component<Annotator> {
 public:
  virtual ~Annotator() = default;

  // Initialize document annotator. The upstream pipeline holds the annotators
  // that run before this one.
  virtual Status Init(const AnnotatorConfig &config, const Pipeline &upstream);

  // Annotate document.
  virtual void Annotate(Document *document) = 0;
};

#define REGISTER_ANNOTATOR(type, component) \
    REGISTER_COMPONENT_TYPE(spotter::nlp::Annotator, type, component)

// Document annotation pipeline. Annotators run in the order they were added.
class Pipeline {
 public:
  Pipeline() = default;
  ~Pipeline();

  // Create annotator of the registered type, initialize it, and add it to the
  // end of the pipeline. Nothing is added if initialization fails.
  Status Add(const string &type, const AnnotatorConfig &config);
  Status Add(const string &type) { return Add(type, AnnotatorConfig()); }

  // Annotate document.
  void Annotate(Document *document) const;

  // Check for no-op pipeline.
  bool empty() const { return annotators_.empty(); }

  // Names of the annotators in the pipeline.
  const std::vector<string> &names() const { return names_; }

 private:
  // Document annotators.
  std::vector<Annotator *> annotators_;

  // Annotator type names.
  std::vector<string> names_;

  DISALLOW_COPY_AND_ASSIGN(Pipeline);
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_DOCUMENT_ANNOTATOR_H_
