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

#ifndef SPOTTER_FILE_TEXTMAP_H_
#define SPOTTER_FILE_TEXTMAP_H_

#include <string>
#include <vector>

#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/file/file.h"

namespace spotter {

// A text map file is a text file with one entry per line. The key and
// value are separated by a tab character. Carriage returns before the end of
// line are dropped.
class TextMapInput {
 public:
  TextMapInput(const std::vector<string> &filenames, int buffer_size = 1 << 16);
  TextMapInput(const string &filename) : TextMapInput({filename}, 1 << 16) {}
  ~TextMapInput();

  // Read next entry from the input files. Returns false if there are no more
  // entries or if a file could not be read; check status() to tell the two
  // apart.
  bool Next();

  // Returns the line number of the current entry in the current file.
  int line() const { return line_; }

  // Returns current key and value.
  const string &key() const { return key_; }
  const string &value() const { return value_; }

  // Returns the error that stopped reading, or OK.
  const Status &status() const { return status_; }

 private:
  // Get next character from input. Returns -1 on end of current file.
  int NextChar() {
    if (next_ < end_) {
      return static_cast<uint8>(*next_++);
    } else {
      return Fill();
    }
  }

  // Fill buffer and return first character or -1 if end of current file.
  int Fill();

  // Close current file.
  void CloseFile();

  // Current file.
  File *file_ = nullptr;

  // Input files.
  std::vector<string> filenames_;

  // Current file number.
  int current_file_ = 0;

  // Input buffer.
  int buffer_size_;
  char *buffer_;
  char *next_;
  char *end_;

  // Current line number in current file (1-based).
  int line_ = 0;

  // Current key and value.
  string key_;
  string value_;

  // Read error.
  Status status_;
};

}  // namespace spotter

#endif  // SPOTTER_FILE_TEXTMAP_H_
