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

#ifndef SPOTTER_UTIL_UNICODE_H_
#define SPOTTER_UTIL_UNICODE_H_

#include <string.h>
#include <string>
#include <vector>

#include "spotter/base/status.h"
#include "spotter/base/types.h"

namespace spotter {

extern const uint8 utf8_skip_tab[];

// String normalization flags.
enum Normalization {
  NORMALIZE_NONE        = 0x00,  // no normalization
  NORMALIZE_CASE        = 0x01,  // lowercase
  NORMALIZE_LETTERS     = 0x02,  // remove diacritics
  NORMALIZE_DIGITS      = 0x04,  // replace all digits with 9
  NORMALIZE_PUNCTUATION = 0x08,  // remove punctuation
  NORMALIZE_WHITESPACE  = 0x10,  // remove whitespace
  NORMALIZE_NAME        = 0x20,  // remove periods and dashes

  // Default normalization for token norms.
  NORMALIZE_DEFAULT = NORMALIZE_CASE | NORMALIZE_LETTERS,
};

// Parses a list of normalization specifiers to a normalization bit mask.
// The following specifiers are supported:
//   c: NORMALIZE_CASE
//   l: NORMALIZE_LETTERS
//   d: NORMALIZE_DIGITS
//   p: NORMALIZE_PUNCTUATION
//   w: NORMALIZE_WHITESPACE
//   n: NORMALIZE_NAME
// Returns INVALID_ARGUMENT for unknown specifiers.
Status ParseNormalization(const string &spec, Normalization *normalization);

// Returns string with normalization specifiers for flags.
string NormalizationString(Normalization normalization);

// Unicode string. This is used instead of wstring where the size of wchar_t is
// platform dependent.
typedef std::vector<char32> ustring;

// Unicode code point categorization and conversion. Only the Latin, Greek and
// Cyrillic blocks have case and diacritics mappings; other code points are
// passed through unchanged.
class Unicode {
 public:
  // Check if code point is a decimal digit.
  static bool IsDigit(char32 c) { return c >= '0' && c <= '9'; }

  // Check if code point is a letter.
  static bool IsLetter(char32 c);

  // Check if code point is a letter or digit.
  static bool IsLetterOrDigit(char32 c) { return IsLetter(c) || IsDigit(c); }

  // Check if code point is a space or line separator.
  static bool IsSpace(char32 c);

  // Check if code point is a line break.
  static bool IsLineBreak(char32 c) { return c == '\n'; }

  // Check if code point is punctuation.
  static bool IsPunctuation(char32 c);

  // Check if code point is a period or a dash.
  static bool IsNamePunctuation(char32 c);

  // Convert code point to lower case.
  static char32 ToLower(char32 c);

  // Convert code point to upper case.
  static char32 ToUpper(char32 c);

  // Remove diacritics from letter.
  static char32 ToBase(char32 c);

  // Normalize code point based on normalization flags. Returns zero for code
  // points that should be removed.
  static char32 Normalize(char32 c, int flags);
};

// UTF-8 string categorization and conversion.
class UTF8 {
 public:
  // Maximum length of UTF8 encoded code point.
  static const int MAXLEN = 4;

  // Returns the length of the UTF8 string in characters.
  static int Length(const char *s, int len);
  static int Length(const string &s) { return Length(s.data(), s.size()); }

  // Returns the length of the next UTF8 character.
  static int CharLen(const char *s) {
    return utf8_skip_tab[*reinterpret_cast<const uint8 *>(s)];
  }

  // Returns pointer to next UTF8 character in string.
  static const char *Next(const char *s) { return s + CharLen(s); }

  // Returns next UTF8 code point in string. Returns -1 on errors.
  static char32 Decode(const char *s, int len);

  // Decodes UTF8 string to sequence of Unicode code points. Invalid byte
  // sequences are decoded as U+FFFD.
  static void DecodeString(const char *s, int len, ustring *result);
  static void DecodeString(const string &str, ustring *result) {
    DecodeString(str.data(), str.size(), result);
  }

  // Encodes one Unicode point and appends it to string. Returns the number
  // of bytes added.
  static int Encode(char32 code, string *str);

  // Lowercases UTF8 encoded string.
  static void Lowercase(const char *s, int len, string *result);
  static string Lower(const string &str) {
    string result;
    Lowercase(str.data(), str.size(), &result);
    return result;
  }

  // Uppercases UTF8 encoded string.
  static void Uppercase(const char *s, int len, string *result);
  static string Upper(const string &str) {
    string result;
    Uppercase(str.data(), str.size(), &result);
    return result;
  }

  // Normalizes UTF8 encoded string for matching.
  static void Normalize(const char *s, int len, int flags, string *normalized);
  static void Normalize(const string &str, int flags, string *normalized) {
    Normalize(str.data(), str.size(), flags, normalized);
  }
};

}  // namespace spotter

#endif  // SPOTTER_UTIL_UNICODE_H_
