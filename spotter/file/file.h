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

#ifndef SPOTTER_FILE_FILE_H_
#define SPOTTER_FILE_FILE_H_

#include <string>

#include "spotter/base/macros.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"

namespace spotter {

// Read-only file backed by a POSIX file descriptor. Lexicons and input texts
// are only read at configuration time, so there is no write support.
class File {
 public:
  // Open file for reading.
  static Status Open(const string &name, File **f);

  // Read up to "size" bytes from the file at the current position. The number
  // of bytes read is returned in "read"; zero means end of file.
  Status Read(void *buffer, size_t size, uint64 *read);

  // Close the file and delete the file object.
  Status Close();

  // Read contents of file.
  static Status ReadContents(const string &filename, string *data);

 private:
  File(int fd, const string &filename) : fd_(fd), filename_(filename) {}
  ~File();

  // File descriptor.
  int fd_;

  // File name for error messages.
  string filename_;

  DISALLOW_COPY_AND_ASSIGN(File);
};

}  // namespace spotter

#endif  // SPOTTER_FILE_FILE_H_
