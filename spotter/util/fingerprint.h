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

#ifndef SPOTTER_UTIL_FINGERPRINT_H_
#define SPOTTER_UTIL_FINGERPRINT_H_

#include <stddef.h>
#include <string>
#include <vector>

#include "spotter/base/types.h"

namespace spotter {

// Concatenate two fingerprints.
uint64 FingerprintCat(uint64 fp1, uint64 fp2);

// Compute 64-bit fingerprint for data. It never returns 0 or 1.
uint64 Fingerprint(const char *bytes, size_t len);
inline uint64 Fingerprint(const string &str) {
  return Fingerprint(str.data(), str.size());
}

// Compute fingerprint for a sequence of words. Phrases with the same words in
// the same order have the same fingerprint; the word boundaries are part of
// the fingerprint, so ["a b"] and ["a", "b"] differ.
uint64 PhraseFingerprint(const std::vector<string> &words);

}  // namespace spotter

#endif  // SPOTTER_UTIL_FINGERPRINT_H_
