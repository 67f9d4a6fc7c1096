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

#include "spotter/file/textmap.h"

#include <stdlib.h>

#include "spotter/base/logging.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"
#include "spotter/file/file.h"

namespace spotter {

TextMapInput::TextMapInput(const std::vector<string> &filenames,
                           int buffer_size)
    : filenames_(filenames), buffer_size_(buffer_size) {
  // Allocate input buffer.
  buffer_ = static_cast<char *>(malloc(buffer_size));
  next_ = end_ = buffer_;
}

TextMapInput::~TextMapInput() {
  // Deallocate input buffer.
  free(buffer_);

  // Close current input file.
  CloseFile();
}

void TextMapInput::CloseFile() {
  if (file_ == nullptr) return;
  Status st = file_->Close();
  if (!st.ok() && status_.ok()) status_ = st;
  file_ = nullptr;
}

bool TextMapInput::Next() {
  while (status_.ok() && current_file_ < filenames_.size()) {
    if (file_ != nullptr) {
      // Read next line from the current file.
      key_.clear();
      value_.clear();

      // Read key.
      int c;
      while ((c = NextChar()) != -1) {
        if (c == '\t' || c == '\n') break;
        key_.push_back(c);
      }

      // Read value.
      bool has_value = (c == '\t');
      if (has_value) {
        while ((c = NextChar()) != -1) {
          if (c == '\n') break;
          value_.push_back(c);
        }
      }
      string &last = has_value ? value_ : key_;
      if (!last.empty() && last.back() == '\r') last.pop_back();

      if (c == -1 && key_.empty() && value_.empty()) {
        // No more lines in file. Switch to next file.
        CloseFile();
        current_file_++;
        line_ = 0;
      } else {
        // Return next entry.
        line_++;
        return true;
      }
    } else {
      // Open the next file.
      status_ = File::Open(filenames_[current_file_], &file_);
      next_ = end_ = buffer_;
    }
  }

  // No more entries.
  return false;
}

int TextMapInput::Fill() {
  DCHECK(next_ == end_);
  DCHECK(file_ != nullptr);
  uint64 bytes;
  Status st = file_->Read(buffer_, buffer_size_, &bytes);
  if (!st.ok()) {
    status_ = st;
    return -1;
  }
  if (bytes == 0) return -1;
  next_ = buffer_;
  end_ = buffer_ + bytes;
  return static_cast<uint8>(*next_++);
}

}  // namespace spotter
