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

#include "spotter/file/file.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "spotter/base/logging.h"

namespace spotter {

namespace {

Status IOError(const string &context, int error) {
  return Status(error == ENOENT ? NOT_FOUND : UNKNOWN, context.c_str(),
                strerror(error));
}

}  // namespace

File::~File() {
  if (fd_ != -1) close(fd_);
}

Status File::Open(const string &name, File **f) {
  int fd = open(name.c_str(), O_RDONLY);
  if (fd == -1) return IOError(name, errno);
  *f = new File(fd, name);
  return Status::OK;
}

Status File::Read(void *buffer, size_t size, uint64 *read) {
  ssize_t rc;
  do {
    rc = ::read(fd_, buffer, size);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) return IOError(filename_, errno);
  *read = rc;
  return Status::OK;
}

Status File::Close() {
  Status st;
  if (fd_ != -1 && close(fd_) != 0) st = IOError(filename_, errno);
  fd_ = -1;
  delete this;
  return st;
}

Status File::ReadContents(const string &filename, string *data) {
  // Open file for reading.
  File *f;
  Status st = Open(filename, &f);
  if (!st.ok()) return st;

  // Read contents in chunks until end of file.
  data->clear();
  char buffer[1 << 14];
  for (;;) {
    uint64 bytes;
    st = f->Read(buffer, sizeof(buffer), &bytes);
    if (!st.ok()) {
      Status closed = f->Close();
      if (!closed.ok()) LOG(WARNING) << closed;
      return st;
    }
    if (bytes == 0) break;
    data->append(buffer, bytes);
  }

  // Close file.
  return f->Close();
}

}  // namespace spotter
