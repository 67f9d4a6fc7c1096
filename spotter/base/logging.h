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

#ifndef SPOTTER_BASE_LOGGING_H_
#define SPOTTER_BASE_LOGGING_H_

#include <sstream>
#include <string>

#include "spotter/base/macros.h"
#include "spotter/base/types.h"

namespace spotter {

const int INFO = 0;
const int WARNING = 1;
const int ERROR = 2;
const int FATAL = 3;
const int NUM_SEVERITIES = 4;

// A log sink receives all log messages at or above the current log level.
// When no sink is installed, messages are written to stdout, or to stderr if
// --logtostderr is set.
class LogSink {
 public:
  virtual ~LogSink() = default;

  // Receive log message.
  virtual void Send(int severity, const char *fname, int line,
                    const string &message) = 0;
};

class LogMessage : public std::basic_ostringstream<char> {
 public:
  LogMessage(const char *fname, int line, int severity);
  ~LogMessage();

  // Minimum severity for LOG statements.
  static int log_level();

  // Minimum log level for VLOG statements.
  static int vlog_level();

  // Install log sink. Passing null restores console logging. Returns the
  // previous sink. The sink is not owned by the logging module.
  static LogSink *SetSink(LogSink *sink);

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
  LogMessageFatal(const char *file, int line) SPOTTER_ATTRIBUTE_COLD;
  SPOTTER_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

#define _LOG_INFO ::spotter::LogMessage(__FILE__, __LINE__, ::spotter::INFO)
#define _LOG_WARNING \
  ::spotter::LogMessage(__FILE__, __LINE__, ::spotter::WARNING)
#define _LOG_ERROR ::spotter::LogMessage(__FILE__, __LINE__, ::spotter::ERROR)
#define _LOG_FATAL ::spotter::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) _LOG_##severity

// Get log level from the --v flag.
#define VLOG_IS_ON(level) ((level) <= ::spotter::LogMessage::vlog_level())

#define VLOG(level)                     \
  if (PREDICT_FALSE(VLOG_IS_ON(level))) \
    ::spotter::LogMessage(__FILE__, __LINE__, ::spotter::INFO)

// CHECK dies with a fatal error if condition is not true. It is not controlled
// by NDEBUG, so the check will be executed regardless of compilation mode.
#define CHECK(condition)           \
  if (PREDICT_FALSE(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

// Builds the message for a failed binary check. Returns null if the check
// passed.
template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2, const char *exprtext) {
  std::ostringstream os;
  os << "Check failed: " << exprtext << " (" << v1 << " vs. " << v2 << ") ";
  return new string(os.str());
}

#define DEFINE_CHECK_OP_IMPL(name, op)                                  \
  template <typename T1, typename T2>                                   \
  inline string *name##Impl(const T1 &v1, const T2 &v2,                 \
                            const char *exprtext) {                     \
    if (PREDICT_TRUE(v1 op v2)) return nullptr;                         \
    return ::spotter::MakeCheckOpString(v1, v2, exprtext);              \
  }

DEFINE_CHECK_OP_IMPL(CheckEQ, ==)
DEFINE_CHECK_OP_IMPL(CheckNE, !=)
DEFINE_CHECK_OP_IMPL(CheckLE, <=)
DEFINE_CHECK_OP_IMPL(CheckLT, <)
DEFINE_CHECK_OP_IMPL(CheckGE, >=)
DEFINE_CHECK_OP_IMPL(CheckGT, >)
#undef DEFINE_CHECK_OP_IMPL

// A container for a string pointer which can be evaluated to a bool, which is
// true iff the pointer is non-null.
struct CheckOpString {
  CheckOpString(string *str) : str_(str) {}
  operator bool() const { return PREDICT_FALSE(str_ != nullptr); }
  string *str_;
};

#define CHECK_OP(name, op, val1, val2)                             \
  while (::spotter::CheckOpString _result =                        \
             ::spotter::name##Impl((val1), (val2),                 \
                                   #val1 " " #op " " #val2))       \
    ::spotter::LogMessageFatal(__FILE__, __LINE__) << *(_result.str_)

#define CHECK_EQ(val1, val2) CHECK_OP(CheckEQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(CheckNE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(CheckLE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(CheckLT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(CheckGE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(CheckGT, >, val1, val2)

#ifndef NDEBUG

#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)

#else

#define DCHECK(condition) while (false && (condition)) LOG(FATAL)

// NDEBUG is defined, so DCHECK_EQ(x, y) and so on do nothing. The arguments
// are still parsed by the compiler.
#define _DCHECK_NOP(x, y) \
  while (false && ((void) (x), (void) (y), 0)) LOG(FATAL)

#define DCHECK_EQ(x, y) _DCHECK_NOP(x, y)
#define DCHECK_NE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LT(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GT(x, y) _DCHECK_NOP(x, y)

#endif

}  // namespace spotter

#endif  // SPOTTER_BASE_LOGGING_H_
