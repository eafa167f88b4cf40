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

#ifndef SEMVIEW_BASE_MACROS_H_
#define SEMVIEW_BASE_MACROS_H_

// Branch prediction hints.
#define PREDICT_FALSE(x) (__builtin_expect(x, 0))
#define PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))

#define SEMVIEW_ATTRIBUTE_NOINLINE __attribute__((noinline))
#define SEMVIEW_ATTRIBUTE_NORETURN __attribute__((noreturn))
#define SEMVIEW_ATTRIBUTE_COLD __attribute__((cold))

// Put this in the private: declarations for a class to be uncopyable.
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName &) = delete;     \
  void operator=(const TypeName &) = delete

// Disallow the default constructor as well as copying.
#define DISALLOW_IMPLICIT_CONSTRUCTORS(TypeName) \
  TypeName() = delete;                           \
  DISALLOW_COPY_AND_ASSIGN(TypeName)

#endif  // SEMVIEW_BASE_MACROS_H_
