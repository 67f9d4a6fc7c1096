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

#include "spotter/base/flags.h"

#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <iostream>

DEFINE_bool(help, false, "Print help message");

namespace spotter {

// Global list of command line flags.
Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

// Program usage message.
static string usage_message;

// Flag type names.
static const char *flagtype[] = {"bool", "int32", "int64", "double", "string"};

Flag::Flag(const char *name, Type type, const char *help,
           const char *filename, void *storage)
    : name(name), type(type), help(help), filename(filename),
      storage(storage), next(nullptr) {
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

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

bool Flag::Set(const char *str) {
  char *end = nullptr;
  switch (type) {
    case BOOL:
      if (strcasecmp(str, "true") == 0 || strcmp(str, "1") == 0 ||
          strcasecmp(str, "yes") == 0) {
        value<bool>() = true;
      } else if (strcasecmp(str, "false") == 0 || strcmp(str, "0") == 0 ||
                 strcasecmp(str, "no") == 0) {
        value<bool>() = false;
      } else {
        return false;
      }
      return true;
    case INT32:
      value<int32>() = strtol(str, &end, 10);
      break;
    case INT64:
      value<int64>() = strtoll(str, &end, 10);
      break;
    case DOUBLE:
      value<double>() = strtod(str, &end);
      break;
    case STRING:
      value<string>() = str;
      return true;
  }
  return end != str && *end == '\0';
}

string Flag::ToString() const {
  switch (type) {
    case BOOL: return value<bool>() ? "true" : "false";
    case INT32: return std::to_string(value<int32>());
    case INT64: return std::to_string(value<int64>());
    case DOUBLE: return std::to_string(value<double>());
    case STRING: return value<string>();
  }
  return "";
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  int i = 1;
  while (i < *argc) {
    int first = i;
    char *arg = argv[i++];

    // Skip positional arguments.
    if (arg[0] != '-') continue;

    // Stop parsing at --.
    const char *name = arg + 1;
    if (*name == '-') name++;
    if (*name == '\0') break;

    // Split argument into name and value.
    string flagname(name);
    const char *value = nullptr;
    size_t eq = flagname.find('=');
    if (eq != string::npos) {
      value = name + eq + 1;
      flagname.resize(eq);
    }

    // Look up flag, also trying a negated boolean flag.
    bool negated = false;
    Flag *flag = Find(flagname.c_str());
    if (flag == nullptr && flagname.compare(0, 2, "no") == 0) {
      flag = Find(flagname.c_str() + 2);
      if (flag != nullptr && flag->type == BOOL && value == nullptr) {
        negated = true;
      } else {
        flag = nullptr;
      }
    }
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Get flag value, possibly from the next argument.
    if (negated) {
      value = "false";
    } else if (value == nullptr) {
      if (flag->type == BOOL) {
        value = "true";
      } else if (i < *argc) {
        value = argv[i++];
      } else {
        std::cerr << "Error: missing value for flag " << arg << " of type "
                  << flagtype[flag->type] << "\n";
        rc = first;
        break;
      }
    }

    if (!flag->Set(value)) {
      std::cerr << "Error: illegal value for flag " << arg << " of type "
                << flagtype[flag->type] << "\nTry --help for options\n";
      rc = first;
      break;
    }

    // Remove the flag and value from the command.
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

void Flag::PrintHelp() {
  if (!usage_message.empty()) std::cout << usage_message << "\n";
  if (head == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head; f != nullptr; f = f->next) {
    std::cout << "  --" << f->name << " (" << f->help << ")\n"
              << "        type: " << flagtype[f->type]
              << "  default: " << f->ToString() << "\n";
  }
}

}  // namespace spotter
