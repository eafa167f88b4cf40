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

#include "semview/base/init.h"

#include <stdlib.h>
#include <string>

#include "semview/base/flags.h"
#include "semview/base/logging.h"
#include "semview/base/types.h"

namespace semview {

void InitProgram(int *argc, char ***argv, const char *usage) {
  if (*argc == 0) return;

  string message;
  message.append((*argv)[0]);
  message.append(" [OPTIONS]\n");
  if (usage != nullptr) {
    message.append("\n");
    message.append(usage);
    message.append("\n");
  }
  Flag::SetUsageMessage(message);
  if (Flag::ParseCommandLineFlags(argc, *argv) != 0) exit(1);
  VLOG(2) << "Parsed command line flags for " << (*argv)[0];
}

}  // namespace semview
