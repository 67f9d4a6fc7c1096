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

#ifndef SPOTTER_NLP_MATCHER_LABEL_TABLE_H_
#define SPOTTER_NLP_MATCHER_LABEL_TABLE_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"

namespace spotter {
namespace nlp {

// Two-way mapping between labels and dense label ids. Ids are assigned in the
// order labels are added, so id order is label registration order.
class LabelTable {
 public:
  // Add label and return its id. Returns the existing id if the label has
  // already been added.
  int Add(const string &label);

  // Returns id for label, or -1 if the label is unknown.
  int Find(const string &label) const;

  // Returns the label for an id.
  const string &Lookup(int id) const {
    DCHECK_GE(id, 0);
    DCHECK_LT(id, labels_.size());
    return labels_[id];
  }

  // Number of labels in table.
  int size() const { return labels_.size(); }

 private:
  // Labels indexed by id.
  std::vector<string> labels_;

  // Mapping from label to id.
  std::unordered_map<string, int> ids_;
};

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_LABEL_TABLE_H_
