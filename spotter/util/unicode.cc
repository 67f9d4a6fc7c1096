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

#include "spotter/util/unicode.h"

#include <string>

#include "spotter/base/logging.h"
#include "spotter/base/types.h"

namespace spotter {

// UTF8 character length based on lead byte.
const uint8 utf8_skip_tab[256] = {
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,
  3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,
};

// Base letters for Latin-1 Supplement (U+00C0-U+00FF) and Latin Extended-A
// (U+0100-U+017F). An asterisk means the letter has no base form.
static const char latin1_base[] =
  "AAAAAA*CEEEEIIII*NOOOOO*OUUUUY**aaaaaa*ceeeeiiii*nooooo*ouuuuy*y";

static const char latin_ext_a_base[] =
  "AaAaAaCcCcCcCcDd"
  "DdEeEeEeEeEeGgGg"
  "GgGgHhHhIiIiIiIi"
  "Ii**JjKk*LlLlLlL"
  "lLlNnNnNn***OoOo"
  "Oo**RrRrRrSsSsSs"
  "SsTtTtTtUuUuUuUu"
  "UuUuWwYyYZzZzZzs";

// Replacement character for invalid input.
static const char32 kReplacementChar = 0xFFFD;

Status ParseNormalization(const string &spec, Normalization *normalization) {
  int flags = NORMALIZE_NONE;
  for (char c : spec) {
    switch (c) {
      case 'c': flags |= NORMALIZE_CASE; break;
      case 'l': flags |= NORMALIZE_LETTERS; break;
      case 'd': flags |= NORMALIZE_DIGITS; break;
      case 'p': flags |= NORMALIZE_PUNCTUATION; break;
      case 'w': flags |= NORMALIZE_WHITESPACE; break;
      case 'n': flags |= NORMALIZE_NAME; break;
      default:
        return Status(INVALID_ARGUMENT,
                      "Unknown normalization specifier", spec);
    }
  }
  *normalization = static_cast<Normalization>(flags);
  return Status::OK;
}

string NormalizationString(Normalization normalization) {
  string str;
  if (normalization & NORMALIZE_CASE) str.push_back('c');
  if (normalization & NORMALIZE_LETTERS) str.push_back('l');
  if (normalization & NORMALIZE_DIGITS) str.push_back('d');
  if (normalization & NORMALIZE_PUNCTUATION) str.push_back('p');
  if (normalization & NORMALIZE_WHITESPACE) str.push_back('w');
  if (normalization & NORMALIZE_NAME) str.push_back('n');
  return str;
}

bool Unicode::IsSpace(char32 c) {
  if (c < 0x80) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
  }
  return c == 0xA0 || (c >= 0x2000 && c <= 0x200A) ||
         c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F ||
         c == 0x3000;
}

bool Unicode::IsPunctuation(char32 c) {
  if (c < 0x80) {
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
           (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
  }
  return (c >= 0xA1 && c <= 0xBF) || c == 0xD7 || c == 0xF7 ||
         (c >= 0x2010 && c <= 0x2027) || (c >= 0x2030 && c <= 0x205E) ||
         (c >= 0x3001 && c <= 0x303F);
}

bool Unicode::IsNamePunctuation(char32 c) {
  return c == '.' || c == '-' || (c >= 0x2010 && c <= 0x2015);
}

bool Unicode::IsLetter(char32 c) {
  if (c < 0x80) return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  if (c < 0xC0) return false;
  if (c < 0x250) return c != 0xD7 && c != 0xF7;
  return !IsSpace(c) && !IsPunctuation(c) && c != kReplacementChar;
}

char32 Unicode::ToLower(char32 c) {
  if (c < 0x80) return (c >= 'A' && c <= 'Z') ? c + 0x20 : c;
  if (c < 0xC0) return c;
  if (c <= 0xDE) return c == 0xD7 ? c : c + 0x20;
  if (c < 0x100) return c;
  if (c < 0x180) {
    if (c == 0x130) return 'i';
    if (c == 0x178) return 0xFF;
    if (c <= 0x137 || (c >= 0x14A && c <= 0x177)) {
      return (c & 1) == 0 ? c + 1 : c;
    }
    if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) {
      return (c & 1) == 1 ? c + 1 : c;
    }
    return c;
  }
  if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) return c + 0x20;
  if (c >= 0x400 && c <= 0x40F) return c + 0x50;
  if (c >= 0x410 && c <= 0x42F) return c + 0x20;
  return c;
}

char32 Unicode::ToUpper(char32 c) {
  if (c < 0x80) return (c >= 'a' && c <= 'z') ? c - 0x20 : c;
  if (c < 0xE0) return c;
  if (c <= 0xFE) return c == 0xF7 ? c : c - 0x20;
  if (c == 0xFF) return 0x178;
  if (c < 0x180) {
    if (c == 0x131) return 'I';
    if (c <= 0x137 || (c >= 0x14B && c <= 0x177)) {
      return (c & 1) == 1 ? c - 1 : c;
    }
    if ((c >= 0x13A && c <= 0x148) || (c >= 0x17A && c <= 0x17E)) {
      return (c & 1) == 0 ? c - 1 : c;
    }
    return c;
  }
  if (c == 0x3C2) return 0x3A3;
  if (c >= 0x3B1 && c <= 0x3C9) return c - 0x20;
  if (c >= 0x430 && c <= 0x44F) return c - 0x20;
  if (c >= 0x450 && c <= 0x45F) return c - 0x50;
  return c;
}

char32 Unicode::ToBase(char32 c) {
  if (c < 0xC0 || c >= 0x180) return c;
  char base = c < 0x100 ? latin1_base[c - 0xC0] : latin_ext_a_base[c - 0x100];
  return base == '*' ? c : base;
}

char32 Unicode::Normalize(char32 c, int flags) {
  if (flags & NORMALIZE_CASE) {
    c = ToLower(c);
  }
  if (flags & NORMALIZE_LETTERS) {
    c = ToBase(c);
  }
  if (flags & NORMALIZE_DIGITS) {
    if (IsDigit(c)) c = '9';
  }
  if (flags & NORMALIZE_PUNCTUATION) {
    if (IsPunctuation(c)) c = 0;
  }
  if (flags & NORMALIZE_NAME) {
    if (IsNamePunctuation(c)) c = 0;
  }
  if (flags & NORMALIZE_WHITESPACE) {
    if (IsSpace(c)) c = 0;
  }
  return c;
}

int UTF8::Length(const char *s, int len) {
  const char *end = s + len;
  int n = 0;
  while (s < end) {
    if ((*s++ & 0xc0) != 0x80) n++;
  }
  return n;
}

char32 UTF8::Decode(const char *s, int len) {
  // No more data.
  if (len <= 0) return -1;

  // One character sequence (7-bit value).
  int c0 = *reinterpret_cast<const uint8 *>(s);
  if (c0 < 0x80) return c0;
  if (len <= 1) return -1;

  // Two character sequence (11-bit value).
  int c1 = *reinterpret_cast<const uint8 *>(s + 1) ^ 0x80;
  if (c1 & 0xc0) return -1;
  if (c0 < 0xe0) {
    if (c0 < 0xc0) return -1;
    int code = ((c0 << 6) | c1) & 0x07ff;
    if (code <= 0x7f) return -1;
    return code;
  }
  if (len <= 2) return -1;

  // Three character sequence (16-bit value).
  int c2 = *reinterpret_cast<const uint8 *>(s + 2) ^ 0x80;
  if (c2 & 0xc0) return -1;
  if (c0 < 0xf0) {
    int code = ((((c0 << 6) | c1) << 6) | c2) & 0xffff;
    if (code <= 0x07ff) return -1;
    return code;
  }
  if (len <= 3) return -1;

  // Four character sequence (21-bit value).
  int c3 = *reinterpret_cast<const uint8 *>(s + 3) ^ 0x80;
  if (c3 & 0xc0) return -1;
  if (c0 < 0xf8) {
    int code = ((((((c0 << 6) | c1) << 6) | c2) << 6) | c3) & 0x001fffff;
    if (code <= 0xffff) return -1;
    return code;
  }

  return -1;
}

void UTF8::DecodeString(const char *s, int len, ustring *result) {
  result->clear();
  result->reserve(len);
  const char *end = s + len;
  while (s < end) {
    char32 code = Decode(s, end - s);
    if (code < 0) {
      // Skip one byte of a malformed sequence.
      result->push_back(kReplacementChar);
      s++;
    } else {
      result->push_back(code);
      s = Next(s);
    }
  }
}

int UTF8::Encode(char32 code, string *str) {
  uint32 c = code;

  // One character sequence.
  if (c <= 0x7f) {
    str->push_back(c);
    return 1;
  }

  // Two character sequence.
  if (c <= 0x7ff) {
    str->push_back(0xc0 | (c >> 6));
    str->push_back(0x80 | (c & 0x3f));
    return 2;
  }

  // Three character sequence.
  if (c <= 0xffff) {
    str->push_back(0xe0 | (c >> 12));
    str->push_back(0x80 | ((c >> 6) & 0x3f));
    str->push_back(0x80 | (c & 0x3f));
    return 3;
  }

  // Four character sequence.
  str->push_back(0xf0 | (c >> 18));
  str->push_back(0x80 | ((c >> 12) & 0x3f));
  str->push_back(0x80 | ((c >> 6) & 0x3f));
  str->push_back(0x80 | (c & 0x3f));
  return 4;
}

// Converts each code point in a UTF8 string with a mapping function. Bytes
// below 128 take the fast path. Malformed sequences are copied unchanged.
template <typename F>
static void MapString(const char *s, int len, string *result, F map) {
  result->clear();
  result->reserve(len);
  const char *end = s + len;
  while (s < end) {
    uint8 b = *reinterpret_cast<const uint8 *>(s);
    if (b < 0x80) {
      char32 c = map(b);
      if (c != 0) result->push_back(c);
      s++;
      continue;
    }
    char32 code = UTF8::Decode(s, end - s);
    if (code < 0) {
      result->push_back(*s++);
      continue;
    }
    char32 c = map(code);
    if (c != 0) UTF8::Encode(c, result);
    s = UTF8::Next(s);
  }
}

void UTF8::Lowercase(const char *s, int len, string *result) {
  MapString(s, len, result, [](char32 c) { return Unicode::ToLower(c); });
}

void UTF8::Uppercase(const char *s, int len, string *result) {
  MapString(s, len, result, [](char32 c) { return Unicode::ToUpper(c); });
}

void UTF8::Normalize(const char *s, int len, int flags, string *normalized) {
  MapString(s, len, normalized,
            [flags](char32 c) { return Unicode::Normalize(c, flags); });
}

}  // namespace spotter
