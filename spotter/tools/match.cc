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

#include <iostream>
#include <string>

#include "spotter/base/flags.h"
#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/file/file.h"
#include "spotter/nlp/document/annotator.h"
#include "spotter/nlp/document/document.h"
#include "spotter/nlp/document/document-tokenizer.h"
#include "spotter/string/text.h"

DEFINE_string(text, "", "Text to match");
DEFINE_string(input, "", "Input text file");
DEFINE_string(terms, "", "Term lexicon files (label<TAB>term per line)");
DEFINE_string(regex, "", "Regex lexicon files (label<TAB>pattern per line)");
DEFINE_string(attr, "TEXT", "Token attribute, e.g. NORM or dose=TEXT,drug=NORM");
DEFINE_bool(fuzzy, false, "Fuzzy term matching");
DEFINE_double(min_ratio, 90.0, "Minimum similarity for fuzzy matches");
DEFINE_int32(flex, 1, "Fuzzy window size flexibility in tokens");
DEFINE_bool(filter, true, "Remove overlapping matches");
DEFINE_string(normalize, "", "Add normalizer with these specifiers, e.g. cl");

using namespace spotter;
using namespace spotter::nlp;

// Tokenize and annotate text and output the token range, label and text of
// each span.
void Process(const Pipeline &pipeline, Text text) {
  DocumentTokenizer tokenizer;
  Document document;
  tokenizer.Tokenize(&document, text);
  pipeline.Annotate(&document);

  for (const Span &span : document.spans()) {
    std::cout << span.begin() << "\t" << span.end() << "\t"
              << span.label() << "\t" << span.GetText() << "\n";
  }
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  // Build annotation pipeline.
  Pipeline pipeline;
  if (!FLAGS_normalize.empty()) {
    AnnotatorConfig config;
    config.Set("normalization", FLAGS_normalize);
    CHECK(pipeline.Add("normalizer", config));
  }

  AnnotatorConfig config;
  config.Set("terms", FLAGS_terms);
  config.Set("regex", FLAGS_regex);
  config.Set("attr", FLAGS_attr);
  config.Set("fuzzy", FLAGS_fuzzy);
  config.Set("min_ratio", FLAGS_min_ratio);
  config.Set("flex", FLAGS_flex);
  config.Set("filter_matches", FLAGS_filter);
  Status st = pipeline.Add("generic-matcher", config);
  if (!st.ok()) {
    std::cerr << "Error: " << st << "\n";
    return 1;
  }

  // Match text.
  if (!FLAGS_text.empty()) Process(pipeline, FLAGS_text);

  if (!FLAGS_input.empty()) {
    string contents;
    st = File::ReadContents(FLAGS_input, &contents);
    if (!st.ok()) {
      std::cerr << "Error: " << st << "\n";
      return 1;
    }
    Process(pipeline, contents);
  }

  return 0;
}
