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

#ifndef SPOTTER_NLP_MATCHER_SPAN_FILTER_H_
#define SPOTTER_NLP_MATCHER_SPAN_FILTER_H_

#include <vector>

#include "spotter/nlp/document/document.h"

namespace spotter {
namespace nlp {

// Removes overlapping spans. Spans are considered longest first, and spans
// of equal length in input order. A span is kept if it shares no token with
// a span that has already been kept. The kept spans are returned ordered by
// their first token.
void FilterSpans(std::vector<Span> *spans);

}  // namespace nlp
}  // namespace spotter

#endif  // SPOTTER_NLP_MATCHER_SPAN_FILTER_H_
