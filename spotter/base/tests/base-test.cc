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

#include <string.h>
#include <iostream>
#include <string>

#include "spotter/base/flags.h"
#include "spotter/base/init.h"
#include "spotter/base/logging.h"
#include "spotter/base/registry.h"
#include "spotter/base/status.h"
#include "spotter/base/types.h"

DEFINE_int32(test_flex, 1, "Test integer flag");
DEFINE_bool(test_fuzzy, false, "Test boolean flag");
DEFINE_bool(test_filter, true, "Test negated boolean flag");
DEFINE_string(test_attr, "TEXT", "Test string flag");

using namespace spotter;

// Component type for registry tests.
class Shape : public Component<Shape> {
 public:
  virtual ~Shape() = default;
  virtual int sides() const = 0;
};

REGISTER_COMPONENT_REGISTRY("test shape", Shape);

class Triangle : public Shape {
 public:
  int sides() const override { return 3; }
};

REGISTER_COMPONENT_TYPE(Shape, "triangle", Triangle);

void TestStatus() {
  Status ok;
  CHECK(ok.ok());
  CHECK_EQ(ok.code(), 0);
  CHECK_EQ(ok.ToString(), "OK");

  Status error(NOT_FOUND, "Unknown annotator", "tagger");
  CHECK(!error.ok());
  CHECK_EQ(error.code(), NOT_FOUND);
  CHECK_EQ(string(error.message()), "Unknown annotator: tagger");
  CHECK_EQ(error.ToString(), "ERROR NOT_FOUND : Unknown annotator: tagger");

  Status copy = error;
  CHECK_EQ(copy.code(), NOT_FOUND);
  copy = Status::OK;
  CHECK(copy.ok());
  CHECK_EQ(error.code(), NOT_FOUND);
}

void TestFlags() {
  char arg0[] = "base-test";
  char arg1[] = "--test_flex=3";
  char arg2[] = "--test_fuzzy";
  char arg3[] = "--notest_filter";
  char arg4[] = "--test_attr";
  char arg5[] = "NORM";
  char arg6[] = "input.txt";
  char *argv[] = {arg0, arg1, arg2, arg3, arg4, arg5, arg6, nullptr};
  int argc = 7;
  CHECK_EQ(Flag::ParseCommandLineFlags(&argc, argv), 0);
  CHECK_EQ(argc, 2);
  CHECK(strcmp(argv[1], "input.txt") == 0);
  CHECK_EQ(FLAGS_test_flex, 3);
  CHECK(FLAGS_test_fuzzy);
  CHECK(!FLAGS_test_filter);
  CHECK_EQ(FLAGS_test_attr, "NORM");

  Flag *flag = Flag::Find("test_flex");
  CHECK(flag != nullptr);
  CHECK(!flag->Set("three"));
}

void TestRegistry() {
  CHECK(Shape::Registered("triangle"));
  CHECK(!Shape::Registered("circle"));
  Shape *shape = Shape::Create("triangle");
  CHECK_EQ(shape->sides(), 3);
  delete shape;
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestStatus();
  TestFlags();
  TestRegistry();

  std::cout << "PASS\n";
  return 0;
}
