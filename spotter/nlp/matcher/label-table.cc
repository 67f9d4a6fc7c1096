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

#include "spotter/nlp/matcher/label-table.h"

namespace spotter {
namespace nlp {

int LabelTable::Add(const string &label) {
  auto f = ids_.find(label);
  if (f != ids_.end()) return f->second;
  int id = labels_.size();
  labels_.push_back(label);
  ids_[label] = id;
  return id;
}

int LabelTable::Find(const string &label) const {
  auto f = ids_.find(label);
  return f == ids_.end() ? -1 : f->second;
}

}  // namespace nlp
}  // namespace spotter
