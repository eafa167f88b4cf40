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

#ifndef SEMVIEW_BASE_FLAGS_H_
#define SEMVIEW_BASE_FLAGS_H_

#include <stdint.h>
#include <string>

#include "semview/base/types.h"

namespace semview {

// Guard against inclusion of other flags libraries.
#ifndef DEFINE_VARIABLE

// Command line flag information.
struct Flag {
  // Command line flag types.
  enum Type {BOOL, INT32, STRING};

  // Register command line flag.
  Flag(const char *name, Type type, const char *help,
       const char *filename, void *storage);

  // Get flag value.
  template<typename T> T &value() {
    return *reinterpret_cast<T *>(storage);
  }
  template<typename T> const T &value() const {
    return *reinterpret_cast<const T *>(storage);
  }

  // Sets flag from command line value. Boolean flags take an optional value
  // and are negated by a "no" prefix. Returns false if the value is invalid.
  bool Set(const char *text, bool negated);

  // Returns the name of the flag type.
  const char *type_name() const;

  // Look up flag information for command line flag.
  static Flag *Find(const char *name);

  // Set program usage message for help.
  static void SetUsageMessage(const string &usage);

  // Parse command line flags.
  static int ParseCommandLineFlags(int *argc, char **argv);

  // Print help message.
  static void PrintHelp();

  const char *name;      // flag name
  Type type;             // flag type
  const char *help;      // help message for flag
  const char *filename;  // file where flag is define
  void *storage;         // pointer to flag value
  Flag *next;            // next flag in flag list

  static Flag *head;     // list of all command line flags
  static Flag *tail;     // end of list of all command line flags
};

// Command line flag definitions.
#define DEFINE_VARIABLE(type, fltype, name, value, help) \
  type FLAGS_##name = value;                             \
  static ::semview::Flag flags_##name(#name, fltype, help, __FILE__, \
                                      &FLAGS_##name);

#define DEFINE_bool(name, value, help) \
  DEFINE_VARIABLE(bool, ::semview::Flag::BOOL, name, value, help)

#define DEFINE_int32(name, value, help) \
  DEFINE_VARIABLE(int32_t, ::semview::Flag::INT32, name, value, help)

#define DEFINE_string(name, val, txt) \
  DEFINE_VARIABLE(string, ::semview::Flag::STRING, name, val, txt)

#endif  // DEFINE_VARIABLE

}  // namespace semview

#endif  // SEMVIEW_BASE_FLAGS_H_

