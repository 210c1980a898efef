//===- unittests/BuildFile/ProjectTest.cpp --------------------------------===//
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

#include "../Core/MockTaskEngineDelegate.h"
#include "../Core/TempDir.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/BuildFile/BuildDescription.h"
#include "mkdone/BuildFile/Project.h"
#include "mkdone/Core/StampStore.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Core/TaskRegistry.h"
#include "mkdone/Env/Environment.h"
#include "mkdone/Env/ToolRegistry.h"

#include "gtest/gtest.h"

using namespace mkdone;
using namespace mkdone::buildfile;
using namespace mkdone::unittests;

namespace {

typedef std::vector<std::string> StringList;

class ProjectTest : public ::testing::Test {
protected:
  std::unique_ptr<basic::FileSystem> fs = basic::createLocalFileSystem();
  BuildDescription description;
  std::vector<ConfigOverride> overrides;
  std::string error;

  std::unique_ptr<Project> create(StringRef baseDir = "/work") {
    return Project::create(description, overrides, baseDir, *fs, &error);
  }

  TaskDefinition& define(StringRef name) {
    description.getTaskDefinitions().emplace_back();
    TaskDefinition& definition = description.getTaskDefinitions().back();
    definition.name = name.str();
    return definition;
  }
};

TEST_F(ProjectTest, parseConfigOverride) {
  ConfigOverride entry;
  ASSERT_TRUE(parseConfigOverride("env-dir=/tmp/env", entry));
  EXPECT_EQ(entry.first, "env-dir");
  EXPECT_EQ(entry.second, "/tmp/env");

  ASSERT_TRUE(parseConfigOverride("install-options=", entry));
  EXPECT_EQ(entry.first, "install-options");
  EXPECT_EQ(entry.second, "");

  ASSERT_TRUE(parseConfigOverride("bootstrap=a=b", entry));
  EXPECT_EQ(entry.second, "a=b");

  EXPECT_FALSE(parseConfigOverride("build", entry));
  EXPECT_FALSE(parseConfigOverride("=value", entry));
}

TEST_F(ProjectTest, defaults) {
  auto project = create();
  ASSERT_TRUE(project != nullptr) << error;

  EXPECT_EQ(project->getConfigValue("stamp-dir"), "/work/.mkdone");
  EXPECT_EQ(project->getConfigValue("env-dir"), "/work/env");
  EXPECT_EQ(project->getConfigValue("env-descriptor"),
            "/work/env/pyvenv.cfg");
  EXPECT_EQ(project->getConfigValue("bin-subpath"), "bin");
  EXPECT_EQ(project->getConfigValue("installer"), "pip");
  EXPECT_EQ(project->getConfigValue("install-options"), "");

  EXPECT_EQ(project->getStampStore().getRootDir(), "/work/.mkdone");
  const auto& envConfig = project->getEnvironment().getConfig();
  EXPECT_EQ(envConfig.rootDir, "/work/env");
  EXPECT_EQ(envConfig.bootstrapCommands,
            StringList({ "python3 -m venv /work/env" }));
  EXPECT_TRUE(envConfig.bootstrapInputs.empty());
  EXPECT_TRUE(project->getTaskRegistry().isFinalized());

  // A relative base directory of "." leaves paths relative.
  project = create(".");
  ASSERT_TRUE(project != nullptr) << error;
  EXPECT_EQ(project->getConfigValue("stamp-dir"), ".mkdone");
  EXPECT_EQ(project->getEnvironment().getDescriptorPath(),
            "env/pyvenv.cfg");
}

TEST_F(ProjectTest, configuration) {
  description.getConfig().push_back({ "stamp-dir", { "build/.stamps" } });
  description.getConfig().push_back({ "env-dir", { "/opt/venv" } });
  description.getConfig().push_back(
      { "install-options", { "--no-build-isolation", "-v" } });
  description.getConfig().push_back(
      { "bootstrap", { "python3 install_env.py", "touch marker" } });
  description.getConfig().push_back(
      { "bootstrap-inputs", { "install_env.py" } });
  description.getConfig().push_back({ "installer", { "uv" } });
  overrides.push_back({ "env-descriptor", "/opt/venv/.created" });
  overrides.push_back({ "installer", "pip" });

  auto project = create();
  ASSERT_TRUE(project != nullptr) << error;
  EXPECT_EQ(project->getConfigValue("stamp-dir"), "/work/build/.stamps");
  EXPECT_EQ(project->getConfigValue("env-dir"), "/opt/venv");
  EXPECT_EQ(project->getConfigValue("install-options"),
            "--no-build-isolation -v");

  const auto& environment = project->getEnvironment();
  EXPECT_EQ(environment.getDescriptorPath(), "/opt/venv/.created");
  EXPECT_EQ(environment.getInstallerPath(), "/opt/venv/bin/pip");
  EXPECT_EQ(environment.getConfig().bootstrapCommands,
            StringList({ "python3 install_env.py", "touch marker" }));
  EXPECT_EQ(environment.getConfig().bootstrapInputs,
            StringList({ "/work/install_env.py" }));
  EXPECT_EQ(environment.getInstallCommand("pytest"),
            "/opt/venv/bin/pip install --no-build-isolation -v pytest");
}

TEST_F(ProjectTest, configurationErrors) {
  description.getConfig().push_back({ "jobs", { "4" } });
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "unknown configuration key 'jobs'");

  description.getConfig().clear();
  overrides.push_back({ "verbose", "1" });
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "unknown configuration key 'verbose'");

  overrides.clear();
  description.getConfig().push_back({ "env-dir", { "a", "b" } });
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "configuration key 'env-dir' expects a single value");

  description.getConfig().clear();
  overrides.push_back({ "stamp-dir", "" });
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "stamp and environment directories must not be empty");
}

TEST_F(ProjectTest, tools) {
  description.getToolNames() = { "pytest", "pip-compile", "pip-sync",
                                 "pytest" };
  description.getPackages().push_back({ "pip-compile", "pip-tools" });
  description.getPackages().push_back({ "pip-sync", "pip-tools" });
  description.getToolRequires().push_back({ "pip-sync", "pip-compile" });
  description.getToolRequires().push_back({ "pytest", "requirements.txt" });

  auto project = create();
  ASSERT_TRUE(project != nullptr) << error;

  const auto& tools = project->getToolRegistry();
  EXPECT_EQ(tools.getTools().size(), 3u);
  const env::Tool* sync = tools.lookupTool("pip-sync");
  ASSERT_NE(sync, nullptr);
  EXPECT_EQ(sync->getCommandPath(), "/work/env/bin/pip-sync");
  EXPECT_EQ(sync->getPackage(), "pip-tools");
  EXPECT_EQ(sync->getPrerequisite(), "/work/env/bin/pip-compile");
  EXPECT_EQ(tools.lookupTool("pytest")->getPrerequisite(),
            "/work/requirements.txt");
  EXPECT_EQ(tools.lookupTool("pip-compile")->getPrerequisite(),
            "/work/env/pyvenv.cfg");

  description.getPackages().push_back({ "black", "black[d]" });
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "package given for undeclared tool 'black'");
}

TEST_F(ProjectTest, tasks) {
  description.getTaskNames() = { "build", "test", "build", "docs" };
  description.getToolNames() = { "pytest" };
  TaskDefinition& build = define("build");
  build.inputs = { "src/a.c", "/usr/include/stdio.h" };
  build.run = { "make -C src" };
  build.hasCleanCommands = true;
  build.clean = { "make -C src clean" };
  build.cleanName = "build-distclean";
  TaskDefinition& test = define("test");
  test.requiredTasks = { "build" };
  test.tools = { "pytest" };
  test.run = { "${pytest} -q --basetemp=${stamp-dir}/tmp" };

  auto project = create();
  ASSERT_TRUE(project != nullptr) << error;

  const auto& registry = project->getTaskRegistry();
  ASSERT_EQ(registry.getTasks().size(), 3u);
  EXPECT_EQ(registry.getTasks()[0]->getName(), "build");
  EXPECT_EQ(registry.getTasks()[1]->getName(), "test");
  EXPECT_EQ(registry.getTasks()[2]->getName(), "docs");
  EXPECT_EQ(registry.getAllStamps().size(), 3u);

  const core::Task* buildTask = registry.lookupTask("build");
  EXPECT_EQ(buildTask->getCleanName(), "build-distclean");
  EXPECT_TRUE(buildTask->hasCustomCleanOperation());
  ASSERT_NE(buildTask->getRunOperation(), nullptr);
  EXPECT_EQ(buildTask->getRunOperation()->inputs,
            StringList({ "/work/src/a.c", "/usr/include/stdio.h" }));

  const core::Task* testTask = registry.lookupTask("test");
  EXPECT_EQ(testTask->getCleanName(), "test-clean");
  EXPECT_FALSE(testTask->hasCustomCleanOperation());
  const core::RunOperation* operation = testTask->getRunOperation();
  ASSERT_NE(operation, nullptr);
  EXPECT_EQ(operation->requiredTasks, StringList({ "build" }));
  EXPECT_EQ(operation->requiredTools,
            StringList({ "/work/env/bin/pytest" }));
  EXPECT_EQ(operation->commands,
            StringList({ "/work/env/bin/pytest -q "
                         "--basetemp=/work/.mkdone/tmp" }));

  // A listed task without commands has no run operation.
  EXPECT_EQ(registry.lookupTask("docs")->getRunOperation(), nullptr);
}

TEST_F(ProjectTest, taskErrors) {
  description.getTaskNames() = { "build" };
  define("test").run = { "true" };
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "command for undeclared task 'test'");

  description.getTaskDefinitions().clear();
  define("build").tools = { "pytest" };
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "task 'build' uses undeclared tool 'pytest'");

  description.getTaskDefinitions().clear();
  define("build").requiredTasks = { "configure" };
  EXPECT_TRUE(create() == nullptr);
  EXPECT_EQ(error, "task 'build' requires undeclared task 'configure'");
}

TEST_F(ProjectTest, expandCommand) {
  description.getToolNames() = { "pytest" };
  auto project = create();
  ASSERT_TRUE(project != nullptr) << error;

  std::string result;
  ASSERT_TRUE(project->expandCommand("${pytest} $$HOME $PATH ${env-dir}",
                                     result, &error)) << error;
  EXPECT_EQ(result, "/work/env/bin/pytest $HOME $PATH /work/env");

  ASSERT_TRUE(project->expandCommand("${pip} install -e .", result, &error));
  EXPECT_EQ(result, "/work/env/bin/pip install -e .");

  ASSERT_TRUE(project->expandCommand("echo $", result, &error));
  EXPECT_EQ(result, "echo $");

  EXPECT_FALSE(project->expandCommand("${black} .", result, &error));
  EXPECT_EQ(error, "unknown reference '${black}' in command");

  EXPECT_FALSE(project->expandCommand("echo ${pytest", result, &error));
  EXPECT_EQ(error, "unterminated reference in command '{pytest'");
}

TEST_F(ProjectTest, buildsThroughEngine) {
  TmpDir tempDir(__func__);
  description.getTaskNames() = { "build", "test" };
  description.getToolNames() = { "pytest" };
  description.getConfig().push_back({ "bootstrap", { "create-env" } });
  define("build").run = { "compile" };
  TaskDefinition& test = define("test");
  test.requiredTasks = { "build" };
  test.tools = { "pytest" };
  test.run = { "${pytest}" };

  auto project = create(tempDir.str());
  ASSERT_TRUE(project != nullptr) << error;
  const auto& environment = project->getEnvironment();

  MockCommandRunner runner;
  MockTaskEngineDelegate delegate;
  runner.setOutput("create-env", environment.getDescriptorPath());
  runner.setOutput(environment.getInstallCommand("pytest"),
                   environment.getCommandPath("pytest"));

  core::TaskEngine engine(project->getTaskRegistry(), runner, delegate);
  ASSERT_TRUE(project->addRules(engine, &error)) << error;
  ASSERT_TRUE(engine.build("test"));
  EXPECT_EQ(runner.getCommands(),
            StringList({ "compile", "create-env",
                         environment.getInstallCommand("pytest"),
                         environment.getCommandPath("pytest") }));

  runner.clearCommands();
  ASSERT_TRUE(engine.build("test"));
  EXPECT_TRUE(runner.getCommands().empty());
  EXPECT_TRUE(delegate.getMessages().empty());
}

TEST_F(ProjectTest, buildTarget) {
  TmpDir tempDir(__func__);
  description.getTaskNames() = { "build", "test" };
  description.getToolNames() = { "pytest" };
  description.getConfig().push_back({ "bootstrap", { "create-env" } });
  define("build").run = { "compile" };
  TaskDefinition& test = define("test");
  test.run = { "check" };
  test.clean = { "rm-cache" };
  test.hasCleanCommands = true;
  test.cleanName = "test-distclean";

  auto project = create(tempDir.str());
  ASSERT_TRUE(project != nullptr) << error;
  const auto& environment = project->getEnvironment();
  const auto& registry = project->getTaskRegistry();
  std::string buildStamp = registry.lookupTask("build")->getStampPath().str();
  std::string testStamp = registry.lookupTask("test")->getStampPath().str();

  MockCommandRunner runner;
  MockTaskEngineDelegate delegate;
  runner.setOutput("create-env", environment.getDescriptorPath());
  runner.setOutput(environment.getInstallCommand("pytest"),
                   environment.getCommandPath("pytest"));

  core::TaskEngine engine(project->getTaskRegistry(), runner, delegate);
  ASSERT_TRUE(project->addRules(engine, &error)) << error;

  // A task name always reruns the task.
  ASSERT_TRUE(project->buildTarget(engine, "build"));
  ASSERT_TRUE(project->buildTarget(engine, "build"));
  EXPECT_EQ(runner.getCommands(), StringList({ "compile", "compile" }));
  EXPECT_FALSE(fs->getFileInfo(buildStamp).isMissing());

  // Clean names run the clean operation.
  runner.clearCommands();
  ASSERT_TRUE(project->buildTarget(engine, "build-clean"));
  EXPECT_TRUE(runner.getCommands().empty());
  EXPECT_TRUE(fs->getFileInfo(buildStamp).isMissing());

  ASSERT_TRUE(project->buildTarget(engine, "test"));
  ASSERT_TRUE(project->buildTarget(engine, "test-distclean"));
  EXPECT_EQ(runner.getCommands(), StringList({ "check", "rm-cache" }));
  EXPECT_TRUE(fs->getFileInfo(testStamp).isMissing());
  EXPECT_FALSE(project->buildTarget(engine, "test-clean"));

  // Tool install names and "env" are built as aliases.
  runner.clearCommands();
  delegate.clearMessages();
  ASSERT_TRUE(project->buildTarget(engine, "pytest-install"));
  ASSERT_TRUE(project->buildTarget(engine, "env"));
  EXPECT_EQ(runner.getCommands(),
            StringList({ "create-env",
                         environment.getInstallCommand("pytest") }));

  // "clean" removes every stamp.
  ASSERT_TRUE(project->buildTarget(engine, "build"));
  ASSERT_TRUE(project->buildTarget(engine, "test"));
  ASSERT_TRUE(project->buildTarget(engine, "clean"));
  EXPECT_TRUE(fs->getFileInfo(buildStamp).isMissing());
  EXPECT_TRUE(fs->getFileInfo(testStamp).isMissing());

  // "env-realclean" removes the environment, and paths are built directly.
  ASSERT_TRUE(project->buildTarget(engine, "env-realclean"));
  EXPECT_TRUE(fs->getFileInfo(environment.getRootDir().str()).isMissing());
  runner.clearCommands();
  ASSERT_TRUE(project->buildTarget(engine,
                                   environment.getCommandPath("pytest")));
  EXPECT_EQ(runner.getCommands(),
            StringList({ "create-env",
                         environment.getInstallCommand("pytest") }));
  EXPECT_TRUE(delegate.getMessages().empty());
}

TEST_F(ProjectTest, taskNamedLikeCleanName) {
  TmpDir tempDir(__func__);
  // A task named like another task's default clean name is rejected, so
  // "<task>-clean" can never run a task.
  description.getTaskNames() = { "lint", "lint-clean" };
  EXPECT_TRUE(create(tempDir.str()) == nullptr);
  EXPECT_EQ(error, "task 'lint-clean' conflicts with the clean operation of "
            "task 'lint'");
}

}
