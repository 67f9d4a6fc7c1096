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

#include <string>

#include "spotter/base/logging.h"
#include "spotter/base/status.h"
#include "spotter/nlp/document/annotator.h"
#include "spotter/nlp/document/document.h"
#include "spotter/util/unicode.h"

namespace spotter {
namespace nlp {

// Sets the normalized form of each token from the token word. The
// normalization parameter is a list of normalization specifiers, e.g. "cl"
// for case folding and removal of diacritics.
class Normalizer : public Annotator {
 public:
  Status Init(const AnnotatorConfig &config,
              const Pipeline &upstream) override {
    string spec = config.Get("normalization", "cl");
    Status st = ParseNormalization(spec, &normalization_);
    if (!st.ok()) return st;
    VLOG(1) << "Token normalization: " << NormalizationString(normalization_);
    return Status::OK;
  }

  void Annotate(Document *document) override {
    string norm;
    for (int i = 0; i < document->length(); ++i) {
      const string &word = document->token(i).word();
      UTF8::Normalize(word, normalization_, &norm);
      document->SetNorm(i, norm);
    }
  }

 private:
  Normalization normalization_ = NORMALIZE_DEFAULT;
};

REGISTER_ANNOTATOR("normalizer", Normalizer);

}  // namespace nlp
}  // namespace spotter
