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

// The fingerprint mixing function is based on the fingerprint2011 code from
// or-tools.

#include "spotter/util/fingerprint.h"

#include <string.h>

#include "spotter/base/types.h"

namespace spotter {

uint64 FingerprintCat(uint64 fp1, uint64 fp2) {
  // Two big prime numbers.
  const uint64 mul1 = 0xC6A4A7935BD1E995u;
  const uint64 mul2 = 0x228876A7198B743u;

  const uint64 a = fp1 * mul1 + fp2 * mul2;

  // Never returns 0 or 1 since something is only added to 'a' when the bits
  // remaining after the shift are not all set.
  return a + (~a >> 47);
}

uint64 Fingerprint(const char *bytes, size_t len) {
  // Some big prime number.
  uint64 fp = 0xA5B85C5E198ED849u;
  const char *end = bytes + len;
  while (bytes + sizeof(uint64) <= end) {
    uint64 word;
    memcpy(&word, bytes, sizeof(uint64));
    fp = FingerprintCat(fp, word);
    bytes += sizeof(uint64);
  }
  uint64 residual = 0;
  while (bytes < end) {
    residual = residual << 8 | *reinterpret_cast<const uint8 *>(bytes);
    bytes++;
  }

  return FingerprintCat(fp, residual);
}

uint64 PhraseFingerprint(const std::vector<string> &words) {
  uint64 fp = 1;
  for (const string &word : words) {
    fp = FingerprintCat(fp, Fingerprint(word));
  }
  return fp;
}

}  // namespace spotter
