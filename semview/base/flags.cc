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

#include "semview/base/flags.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <iostream>
#include <limits>

#include "semview/base/logging.h"

DEFINE_bool(help, false, "Print help message");

namespace semview {

// Global list of command line flags.
Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

// Program usage message.
static string usage_message;

Flag::Flag(const char *name, Type type, const char *help,
           const char *filename, void *storage)
    : name(name), type(type), help(help), filename(filename), storage(storage),
      next(nullptr) {
  if (head == nullptr) {
    head = tail = this;
  } else {
    tail->next = this;
    tail = this;
  }
}

Flag *Flag::Find(const char *name) {
  for (Flag *f = head; f != nullptr; f = f->next) {
    if (strcmp(name, f->name) == 0) return f;
  }
  return nullptr;
}

const char *Flag::type_name() const {
  switch (type) {
    case BOOL: return "bool";
    case INT32: return "int32";
    case STRING: return "string";
  }
  return "unknown";
}

bool Flag::Set(const char *text, bool negated) {
  switch (type) {
    case BOOL: {
      bool b = true;
      if (text != nullptr) {
        if (strcmp(text, "true") == 0 || strcmp(text, "1") == 0) {
          b = true;
        } else if (strcmp(text, "false") == 0 || strcmp(text, "0") == 0) {
          b = false;
        } else {
          return false;
        }
      }
      value<bool>() = negated ? !b : b;
      return true;
    }

    case INT32: {
      if (negated || text == nullptr || *text == '\0') return false;
      errno = 0;
      char *end = nullptr;
      long number = strtol(text, &end, 10);
      if (*end != '\0' || errno != 0 ||
          number < std::numeric_limits<int32>::min() ||
          number > std::numeric_limits<int32>::max()) {
        return false;
      }
      value<int32>() = number;
      return true;
    }

    case STRING:
      if (negated || text == nullptr) return false;
      value<string>() = text;
      return true;
  }
  return false;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  int i = 1;
  while (i < *argc) {
    int first = i;
    char *arg = argv[i++];
    if (arg[0] != '-') continue;

    // Stop at "--".
    char *name = arg + (arg[1] == '-' ? 2 : 1);
    if (*name == '\0') break;

    // Split --name=value.
    const char *value = nullptr;
    char *eq = strchr(name, '=');
    if (eq != nullptr) {
      *eq = '\0';
      value = eq + 1;
    }

    // Look up flag, trying the "no" prefix for negated boolean flags.
    bool negated = false;
    Flag *flag = Find(name);
    if (flag == nullptr && strncmp(name, "no", 2) == 0) {
      flag = Find(name + 2);
      negated = flag != nullptr && flag->type == BOOL;
      if (!negated) flag = nullptr;
    }
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Non-boolean flags can take their value from the next argument.
    if (value == nullptr && flag->type != BOOL && i < *argc) {
      value = argv[i++];
    }
    if (!flag->Set(value, negated)) {
      std::cerr << "Error: illegal value for flag --" << flag->name
                << " of type " << flag->type_name() << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Remove flag and value from the arguments.
    while (first < i) argv[first++] = nullptr;
  }

  // Shrink the argument list.
  int j = 1;
  for (int k = 1; k < *argc; k++) {
    if (argv[k] != nullptr) argv[j++] = argv[k];
  }
  *argc = j;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }

  return rc;
}

std::ostream &operator<<(std::ostream &os, const Flag &flag) {
  switch (flag.type) {
    case Flag::BOOL:
      os << (flag.value<bool>() ? "true" : "false");
      break;
    case Flag::INT32:
      os << flag.value<int32>();
      break;
    case Flag::STRING:
      os << "\"" << flag.value<string>() << "\"";
      break;
  }
  return os;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) std::cout << usage_message << "\n";
  if (head == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head; f != nullptr; f = f->next) {
    std::cout << "  --" << f->name << " (" << f->help << ")\n"
              << "        type: " << f->type_name() << "  default: " << *f
              << "\n";
  }
}

}  // namespace semview
