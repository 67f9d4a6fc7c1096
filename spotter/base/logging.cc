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

#include "spotter/base/logging.h"

#include <stdio.h>
#include <stdlib.h>
#include <time.h>
#include <sys/time.h>
#include <string>

#include "spotter/base/flags.h"
#include "spotter/base/types.h"

DEFINE_int32(v, 0, "Log level for VLOG");
DEFINE_int32(loglevel, 0, "Discard messages logged at a lower severity");
DEFINE_bool(logtostderr, false, "Log messages to stderr");

namespace spotter {

// Installed log sink or null for console output.
static LogSink *log_sink = nullptr;

int LogMessage::log_level() {
  return FLAGS_loglevel;
}

int LogMessage::vlog_level() {
  return FLAGS_v;
}

LogSink *LogMessage::SetSink(LogSink *sink) {
  LogSink *previous = log_sink;
  log_sink = sink;
  return previous;
}

LogMessage::LogMessage(const char *fname, int line, int severity)
    : fname_(fname), line_(line), severity_(severity) {}

void LogMessage::GenerateLogMessage() {
  if (log_sink != nullptr) {
    log_sink->Send(severity_, fname_, line_, str());
    return;
  }

  const size_t BUFSIZE = 30;
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  int usec = tv.tv_usec;
  char timestr[BUFSIZE];
  strftime(timestr, BUFSIZE, "%Y-%m-%d %H:%M:%S", localtime(&tv.tv_sec));

  fprintf(FLAGS_logtostderr ? stderr : stdout,
          "[%s.%06d: %c %s:%d] %s\n",
          timestr, usec, "IWEF"[severity_], fname_, line_, str().c_str());
}

LogMessage::~LogMessage() {
  if (severity_ >= log_level()) GenerateLogMessage();
}

LogMessageFatal::LogMessageFatal(const char *file, int line)
    : LogMessage(file, line, FATAL) {}

LogMessageFatal::~LogMessageFatal() {
  // Fatal messages always go to stderr, also when a sink is installed.
  SetSink(nullptr);
  FLAGS_logtostderr = true;
  GenerateLogMessage();
  abort();
}

}  // namespace spotter
