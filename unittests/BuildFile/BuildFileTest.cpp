//===- unittests/BuildFile/BuildFileTest.cpp ------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "../Core/TempDir.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/BuildFile/BuildDescription.h"
#include "mkdone/BuildFile/BuildFile.h"

#include "gtest/gtest.h"

#include <memory>

using namespace mkdone;
using namespace mkdone::buildfile;

namespace {

typedef std::vector<std::string> StringList;

class TestBuildFileDelegate : public BuildFileDelegate {
  std::unique_ptr<basic::FileSystem> fileSystem =
    basic::createLocalFileSystem();

public:
  std::vector<std::string> errors;

  virtual basic::FileSystem& getFileSystem() override { return *fileSystem; }

  virtual void setFileContentsBeingParsed(StringRef) override {}

  virtual void error(StringRef filename, const BuildFileToken& at,
                     const Twine& message) override {
    errors.push_back(message.str());
  }
};

class BuildFileTest : public ::testing::Test {
protected:
  TmpDir tempDir{ "BuildFileTest" };
  TestBuildFileDelegate delegate;

  std::unique_ptr<BuildDescription> load(StringRef contents) {
    std::string path = tempDir.path("mkdone.yaml");
    writeFile(path, contents);
    BuildFile buildFile(path, delegate);
    return buildFile.load();
  }

  /// Load \arg contents, expecting it to fail with the single \arg message.
  void expectError(StringRef contents, StringRef message) {
    delegate.errors.clear();
    EXPECT_TRUE(load(contents) == nullptr);
    ASSERT_EQ(delegate.errors.size(), 1u) << contents.str();
    EXPECT_EQ(delegate.errors[0], message.str());
  }
};

TEST_F(BuildFileTest, basic) {
  auto description = load(R"(
client:
  name: mkdone
  version: 1
config:
  stamp-dir: build/.mkdone
  install-options: [--no-build-isolation, -v]
tasks: [build, test, build]
tools: [pytest, pip-compile, pip-sync]
packages: { pip-compile: pip-tools, pip-sync: pip-tools }
tool-requires: { pip-sync: pip-compile }
commands:
  build:
    inputs: [src/a.c, src/b.c]
    run: "make -C src"
    clean: ["rm -f src/*.o"]
    clean-name: build-distclean
  test:
    requires: build
    tools: [pytest]
    run:
      - ${pytest} -q
      - echo done
)");
  ASSERT_TRUE(description != nullptr);
  EXPECT_TRUE(delegate.errors.empty());

  EXPECT_EQ(description->getClientName(), "mkdone");
  EXPECT_EQ(description->getClientVersion(), 1u);

  const auto& config = description->getConfig();
  ASSERT_EQ(config.size(), 2u);
  EXPECT_EQ(config[0].first, "stamp-dir");
  EXPECT_EQ(config[0].second, StringList({ "build/.mkdone" }));
  EXPECT_EQ(config[1].first, "install-options");
  EXPECT_EQ(config[1].second, StringList({ "--no-build-isolation", "-v" }));

  EXPECT_EQ(description->getTaskNames(),
            StringList({ "build", "test", "build" }));
  EXPECT_EQ(description->getToolNames(),
            StringList({ "pytest", "pip-compile", "pip-sync" }));
  ASSERT_EQ(description->getPackages().size(), 2u);
  EXPECT_EQ(description->getPackages()[1].first, "pip-sync");
  EXPECT_EQ(description->getPackages()[1].second, "pip-tools");
  ASSERT_EQ(description->getToolRequires().size(), 1u);
  EXPECT_EQ(description->getToolRequires()[0].second, "pip-compile");

  ASSERT_EQ(description->getTaskDefinitions().size(), 2u);
  const TaskDefinition* build = description->lookupTaskDefinition("build");
  ASSERT_NE(build, nullptr);
  EXPECT_EQ(build->inputs, StringList({ "src/a.c", "src/b.c" }));
  EXPECT_EQ(build->run, StringList({ "make -C src" }));
  EXPECT_TRUE(build->hasCleanCommands);
  EXPECT_EQ(build->clean, StringList({ "rm -f src/*.o" }));
  EXPECT_EQ(build->cleanName, "build-distclean");

  const TaskDefinition* test = description->lookupTaskDefinition("test");
  ASSERT_NE(test, nullptr);
  EXPECT_EQ(test->requiredTasks, StringList({ "build" }));
  EXPECT_EQ(test->tools, StringList({ "pytest" }));
  EXPECT_EQ(test->run, StringList({ "${pytest} -q", "echo done" }));
  EXPECT_FALSE(test->hasCleanCommands);
  EXPECT_TRUE(test->cleanName.empty());

  EXPECT_EQ(description->lookupTaskDefinition("docs"), nullptr);
}

TEST_F(BuildFileTest, minimal) {
  auto description = load("client:\n  name: mkdone\n");
  ASSERT_TRUE(description != nullptr);
  EXPECT_EQ(description->getClientVersion(), 0u);
  EXPECT_TRUE(description->getTaskNames().empty());
  EXPECT_TRUE(description->getTaskDefinitions().empty());
}

TEST_F(BuildFileTest, emptyCleanCommands) {
  // An explicitly empty clean list still replaces the default operation.
  auto description = load(R"(
client: { name: mkdone }
tasks: [docs]
commands:
  docs:
    run: [sphinx-build docs out]
    clean: []
)");
  ASSERT_TRUE(description != nullptr);
  const TaskDefinition* docs = description->lookupTaskDefinition("docs");
  ASSERT_NE(docs, nullptr);
  EXPECT_TRUE(docs->hasCleanCommands);
  EXPECT_TRUE(docs->clean.empty());
}

TEST_F(BuildFileTest, clientErrors) {
  expectError("tasks: [build]\n", "expected initial mapping key 'client'");
  expectError("client:\n  name: make\n",
              "unsupported client 'make' (expected 'mkdone')");
  expectError("client:\n  name: mkdone\n  version: 2\n",
              "unsupported client version 2");
  expectError("client:\n  name: mkdone\n  version: one\n",
              "invalid version number in 'client' map");
  expectError("client:\n  name: mkdone\n  flavor: vanilla\n",
              "unexpected key 'flavor' in 'client' map");
  expectError("client: mkdone\n",
              "unexpected 'client' value (expected map)");
  expectError("- client\n", "unexpected top-level node");
}

TEST_F(BuildFileTest, sectionErrors) {
  expectError("client: { name: mkdone }\ntasks: [a]\ntasks: [b]\n",
              "duplicate 'tasks' section");
  expectError("client: { name: mkdone }\ntargets: [a]\n",
              "unexpected top-level section 'targets'");
  expectError("client: { name: mkdone }\ntasks: { a: b }\n",
              "invalid value type for 'tasks' (expected scalar or list)");
  expectError("client: { name: mkdone }\ntools: [[a]]\n",
              "invalid item type for 'tools' (expected scalar)");
  expectError("client: { name: mkdone }\npackages: [a]\n",
              "unexpected 'packages' value (expected map)");
  expectError("client: { name: mkdone }\nconfig: [a]\n",
              "unexpected 'config' value (expected map)");
}

TEST_F(BuildFileTest, commandErrors) {
  expectError("client: { name: mkdone }\ncommands: [a]\n",
              "unexpected 'commands' value (expected map)");
  expectError("client: { name: mkdone }\ncommands:\n  a: [x]\n",
              "invalid value type in 'commands' map");
  expectError("client: { name: mkdone }\n"
              "commands:\n  a:\n    run: x\n  a:\n    run: y\n",
              "duplicate command in 'commands' map");
  expectError("client: { name: mkdone }\n"
              "commands:\n  a:\n    outputs: [x]\n",
              "unexpected attribute 'outputs' for command 'a'");
  expectError("client: { name: mkdone }\n"
              "commands:\n  a:\n    clean-name: [x]\n",
              "invalid value type for 'clean-name' (expected scalar)");
}

TEST_F(BuildFileTest, attributeErrorStopsParsing) {
  // Later attributes and commands are not diagnosed.
  expectError("client: { name: mkdone }\n"
              "commands:\n"
              "  a:\n    outputs: [x]\n    run: [y]\n"
              "  b: [z]\n",
              "unexpected attribute 'outputs' for command 'a'");
  expectError("client: { name: mkdone }\n"
              "commands:\n"
              "  a:\n    run: { x: y }\n    clean: [z]\n"
              "  b:\n    bogus: 1\n",
              "invalid value type for 'run' (expected scalar or list)");
}

TEST_F(BuildFileTest, missingFile) {
  BuildFile buildFile(tempDir.path("missing.yaml"), delegate);
  EXPECT_TRUE(buildFile.load() == nullptr);
  ASSERT_EQ(delegate.errors.size(), 1u);
  EXPECT_EQ(delegate.errors[0],
            "unable to open '" + tempDir.path("missing.yaml") + "'");
}

TEST_F(BuildFileTest, syntaxError) {
  EXPECT_TRUE(load("client: { name: mkdone\n") == nullptr);
  EXPECT_FALSE(delegate.errors.empty());
}

}
