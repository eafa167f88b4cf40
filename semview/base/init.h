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

#ifndef SEMVIEW_BASE_INIT_H_
#define SEMVIEW_BASE_INIT_H_

namespace semview {

// Parses command line flags for program. Exits the process if the flags cannot
// be parsed. The usage message, if given, is printed by --help before the
// flag list.
void InitProgram(int *argc, char **argv[], const char *usage = nullptr);

}  // namespace semview

#endif  // SEMVIEW_BASE_INIT_H_
