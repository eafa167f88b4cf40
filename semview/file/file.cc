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

#include "semview/file/file.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "semview/base/logging.h"

namespace semview {

namespace {

// Returns status for I/O error.
Status IOError(const string &context, int error) {
  return Status(IO_ERROR, context.c_str(), strerror(error));
}

}  // namespace

Status File::ReadContents(const string &filename, string *data) {
  // Open file for reading.
  int fd = open(filename.c_str(), O_RDONLY);
  if (fd == -1) return IOError(filename, errno);

  // Use the file size as a hint for the buffer size.
  data->clear();
  struct stat st;
  if (fstat(fd, &st) == 0 && st.st_size > 0) data->reserve(st.st_size);

  // Read contents.
  char buffer[1 << 16];
  for (;;) {
    ssize_t rc = read(fd, buffer, sizeof(buffer));
    if (rc < 0) {
      if (errno == EINTR) continue;
      int error = errno;
      close(fd);
      return IOError(filename, error);
    }
    if (rc == 0) break;
    data->append(buffer, rc);
  }

  // Close file.
  if (close(fd) != 0) return IOError(filename, errno);
  VLOG(3) << "Read " << data->size() << " bytes from " << filename;
  return Status::OK;
}

Status File::ReadLines(const string &filename, std::vector<string> *lines) {
  string data;
  Status st = ReadContents(filename, &data);
  if (!st.ok()) return st;

  lines->clear();
  size_t begin = 0;
  while (begin < data.size()) {
    size_t end = data.find('\n', begin);
    if (end == string::npos) end = data.size();
    size_t length = end - begin;
    if (length > 0 && data[end - 1] == '\r') length--;
    lines->emplace_back(data, begin, length);
    begin = end + 1;
  }
  return Status::OK;
}

}  // namespace semview
