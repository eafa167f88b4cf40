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

#ifndef SEMVIEW_FILE_FILE_H_
#define SEMVIEW_FILE_FILE_H_

#include <string>
#include <vector>

#include "semview/base/status.h"
#include "semview/base/types.h"

namespace semview {

// Whole-file access to local files.
class File {
 public:
  // Reads the contents of a file into a string.
  static Status ReadContents(const string &filename, string *data);

  // Reads a file and splits it into lines. Line terminators are removed and a
  // trailing newline does not produce an empty last line.
  static Status ReadLines(const string &filename, std::vector<string> *lines);
};

}  // namespace semview

#endif  // SEMVIEW_FILE_FILE_H_
