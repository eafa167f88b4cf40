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

#ifndef SEMVIEW_BASE_LOGGING_H_
#define SEMVIEW_BASE_LOGGING_H_

#include <limits>
#include <sstream>
#include <utility>

#include "semview/base/macros.h"
#include "semview/base/types.h"

namespace semview {

#ifndef LOG

const int INFO = 0;
const int WARNING = 1;
const int ERROR = 2;
const int FATAL = 3;
const int NUM_SEVERITIES = 4;

class LogMessage : public std::basic_ostringstream<char> {
 public:
  LogMessage(const char *fname, int line, int severity);
  ~LogMessage();

  // Minimum severity for LOG statements.
  static int log_level();

  // Minimum log level for VLOG statements.
  static int vlog_level();

 protected:
  void GenerateLogMessage();

 private:
  const char *fname_;
  int line_;
  int severity_;
};

// LogMessageFatal ensures the process will exit in failure after
// logging this message.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line) SEMVIEW_ATTRIBUTE_COLD;
  SEMVIEW_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

#define _LOG_INFO ::semview::LogMessage(__FILE__, __LINE__, ::semview::INFO)
#define _LOG_WARNING \
  ::semview::LogMessage(__FILE__, __LINE__, ::semview::WARNING)
#define _LOG_ERROR ::semview::LogMessage(__FILE__, __LINE__, ::semview::ERROR)
#define _LOG_FATAL ::semview::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) _LOG_##severity

// Get log level from --v flag.
#define VLOG_IS_ON(level) ((level) <= ::semview::LogMessage::vlog_level())

#define VLOG(level)                     \
  if (PREDICT_FALSE(VLOG_IS_ON(level))) \
    ::semview::LogMessage(__FILE__, __LINE__, ::semview::INFO)

// CHECK dies with a fatal error if condition is not true. It is NOT controlled
// by NDEBUG, so the check will be executed regardless of compilation mode.
#define CHECK(condition)           \
  if (PREDICT_FALSE(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

// This formats a value for a failing CHECK_XX statement.
template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) { (*os) << v; }

// Overrides for char types provide readable values for unprintable characters.
template <>
void MakeCheckOpValueString(std::ostream *os, const char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const signed char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const unsigned char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &p);

// A container for a string pointer which can be evaluated to a bool -
// true iff the pointer is non-NULL.
struct CheckOpString {
  CheckOpString(string *str) : str_(str) {}
  // No destructor: if str_ is non-NULL, we're about to LOG(FATAL),
  // so there's no point in cleaning up str_.
  operator bool() const { return PREDICT_FALSE(str_ != nullptr); }
  string *str_;
};

// A helper class for formatting "expr (V1 vs. V2)" in a CHECK_XX statement.
class CheckOpMessageBuilder {
 public:
  // Inserts "exprtext" and " (" to the stream.
  explicit CheckOpMessageBuilder(const char *exprtext);
  ~CheckOpMessageBuilder();
  // For inserting the first variable.
  std::ostream *ForVar1() { return stream_; }
  // For inserting the second variable (adds an intermediate " vs. ").
  std::ostream *ForVar2();
  // Get the result (inserts the closing ")").
  string *NewString();

 private:
  std::ostringstream *stream_;
};

// Build the error message string. Specify no inlining for code size.
template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2,
                          const char *exprtext) SEMVIEW_ATTRIBUTE_NOINLINE;

template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2, const char *exprtext) {
  CheckOpMessageBuilder comb(exprtext);
  MakeCheckOpValueString(comb.ForVar1(), v1);
  MakeCheckOpValueString(comb.ForVar2(), v2);
  return comb.NewString();
}

// Helper functions for CHECK_OP macro. The (size_t, int) and (int, size_t)
// overloads handle unsigned comparisons against int literals.
#define DEFINE_CHECK_OP_IMPL(name, op)                                    \
  template <typename T1, typename T2>                                     \
  inline string *name##Impl(const T1 &v1, const T2 &v2,                   \
                            const char *exprtext) {                       \
    if (PREDICT_TRUE(v1 op v2))                                           \
      return nullptr;                                                     \
    else                                                                  \
      return ::semview::MakeCheckOpString(v1, v2, exprtext);              \
  }                                                                       \
  inline string *name##Impl(int v1, int v2, const char *exprtext) {       \
    return name##Impl<int, int>(v1, v2, exprtext);                        \
  }                                                                       \
  inline string *name##Impl(const size_t v1, const int v2,                \
                            const char *exprtext) {                       \
    if (PREDICT_FALSE(v2 < 0)) {                                          \
      return ::semview::MakeCheckOpString(v1, v2, exprtext);              \
    }                                                                     \
    return name##Impl<size_t, size_t>(v1, static_cast<size_t>(v2),       \
                                      exprtext);                          \
  }                                                                       \
  inline string *name##Impl(const int v1, const size_t v2,                \
                            const char *exprtext) {                       \
    if (PREDICT_FALSE(v1 < 0)) {                                          \
      return ::semview::MakeCheckOpString(v1, v2, exprtext);              \
    }                                                                     \
    return name##Impl<size_t, size_t>(static_cast<size_t>(v1), v2,        \
                                      exprtext);                          \
  }

DEFINE_CHECK_OP_IMPL(EQ, ==)
DEFINE_CHECK_OP_IMPL(NE, !=)
DEFINE_CHECK_OP_IMPL(LE, <=)
DEFINE_CHECK_OP_IMPL(LT, <)
DEFINE_CHECK_OP_IMPL(GE, >=)
DEFINE_CHECK_OP_IMPL(GT, >)
#undef DEFINE_CHECK_OP_IMPL

#define CHECK_OP(name, op, val1, val2)                                 \
  while (::semview::CheckOpString _result =                            \
             ::semview::name##Impl(val1, val2, #val1 " " #op " " #val2)) \
    ::semview::LogMessageFatal(__FILE__, __LINE__) << *(_result.str_)

// CHECK_EQ/NE/...
#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)
#define CHECK_NOTNULL(val) \
  ::semview::CheckNotNull(__FILE__, __LINE__, "'" #val "' Must be non NULL", \
                          (val))

#ifndef NDEBUG
// DCHECK_EQ/NE/...
#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)

#else

#define DCHECK(condition) while (false && (condition)) LOG(FATAL)

// NDEBUG is defined, so DCHECK_EQ(x, y) and so on do nothing. However, we still
// want the compiler to parse x and y.
#define _DCHECK_NOP(x, y) \
  while (false && ((void) (x), (void) (y), 0)) LOG(FATAL)

#define DCHECK_EQ(x, y) _DCHECK_NOP(x, y)
#define DCHECK_NE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LT(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GT(x, y) _DCHECK_NOP(x, y)

#endif

template <typename T>
T &&CheckNotNull(const char *file, int line, const char *exprtext, T &&t) {
  if (t == nullptr) {
    LogMessageFatal(file, line) << string(exprtext);
  }
  return std::forward<T>(t);
}

#endif  // LOG

}  // namespace semview

#endif  // SEMVIEW_BASE_LOGGING_H_
