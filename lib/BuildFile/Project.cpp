//===-- Project.cpp -------------------------------------------------------===//
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

#include "mkdone/BuildFile/Project.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/ShellUtility.h"
#include "mkdone/BuildFile/BuildDescription.h"
#include "mkdone/Core/StampStore.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Core/TaskRegistry.h"
#include "mkdone/Env/Environment.h"
#include "mkdone/Env/ToolRegistry.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Path.h"

using namespace mkdone;
using namespace mkdone::buildfile;

namespace {

/// The recognized configuration keys, and their defaults.
///
/// Keys without a fixed default are derived from other keys in
/// \see Project::configure().
const struct {
  const char* key;
  const char* defaultValue;
} configKeys[] = {
  { "stamp-dir", ".mkdone" },
  { "env-dir", "env" },
  { "env-descriptor", nullptr },
  { "bin-subpath", "bin" },
  { "installer", "pip" },
  { "install-options", nullptr },
  { "bootstrap", nullptr },
  { "bootstrap-inputs", nullptr },
};

bool isConfigKey(StringRef key) {
  for (const auto& entry: configKeys) {
    if (key == entry.key)
      return true;
  }
  return false;
}

std::string resolvePath(StringRef baseDir, StringRef path) {
  if (path.empty() || baseDir.empty() || baseDir == "." ||
      llvm::sys::path::is_absolute(path))
    return path.str();

  SmallString<256> result(baseDir);
  llvm::sys::path::append(result, path);
  return result.str().str();
}

}

bool buildfile::parseConfigOverride(StringRef argument,
                                    ConfigOverride& override_out) {
  auto split = argument.split('=');
  if (split.first.size() == argument.size() || split.first.empty())
    return false;

  override_out = { split.first.str(), split.second.str() };
  return true;
}

Project::Project() {}

Project::~Project() {}

std::unique_ptr<Project>
Project::create(const BuildDescription& description,
                ArrayRef<ConfigOverride> overrides, StringRef baseDir,
                basic::FileSystem& fileSystem, std::string* error_out) {
  std::unique_ptr<Project> project(new Project());
  if (!project->configure(description, overrides, baseDir, fileSystem,
                          error_out))
    return nullptr;
  return project;
}

std::string Project::getConfigValue(StringRef key) const {
  auto it = config.find(key);
  if (it == config.end())
    return "";
  return llvm::join(it->second, " ");
}

bool Project::configure(const BuildDescription& description,
                        ArrayRef<ConfigOverride> overrides, StringRef baseDir,
                        basic::FileSystem& fileSystem,
                        std::string* error_out) {
  // Collect the configuration, with later entries replacing earlier ones.
  for (const auto& entry: description.getConfig()) {
    if (!isConfigKey(entry.first)) {
      *error_out = "unknown configuration key '" + entry.first + "'";
      return false;
    }
    config[entry.first] = entry.second;
  }
  for (const auto& entry: overrides) {
    if (!isConfigKey(entry.first)) {
      *error_out = "unknown configuration key '" + entry.first + "'";
      return false;
    }
    config[entry.first] = { entry.second };
  }
  for (const auto& entry: configKeys) {
    if (entry.defaultValue && !config.count(entry.key))
      config[entry.key] = { entry.defaultValue };
  }

  // Check the single valued keys.
  for (StringRef key: { "stamp-dir", "env-dir", "env-descriptor",
                        "bin-subpath", "installer" }) {
    auto it = config.find(key);
    if (it != config.end() && it->second.size() != 1) {
      *error_out = "configuration key '" + key.str() +
        "' expects a single value";
      return false;
    }
  }

  // Resolve paths.
  std::string stampDir = resolvePath(baseDir, getConfigValue("stamp-dir"));
  std::string envDir = resolvePath(baseDir, getConfigValue("env-dir"));
  if (stampDir.empty() || envDir.empty()) {
    *error_out = "stamp and environment directories must not be empty";
    return false;
  }
  config["stamp-dir"] = { stampDir };
  config["env-dir"] = { envDir };

  env::EnvironmentConfig envConfig;
  envConfig.rootDir = envDir;
  envConfig.descriptorPath =
    resolvePath(baseDir, getConfigValue("env-descriptor"));
  envConfig.binSubpath = getConfigValue("bin-subpath");
  envConfig.installer = getConfigValue("installer");
  envConfig.installOptions = getConfigValue("install-options");
  if (config.count("bootstrap")) {
    envConfig.bootstrapCommands = config["bootstrap"];
  } else {
    envConfig.bootstrapCommands.push_back("python3 -m venv " +
                                          basic::shellEscaped(envDir));
  }
  for (const auto& input: config["bootstrap-inputs"])
    envConfig.bootstrapInputs.push_back(resolvePath(baseDir, input));

  stampStore = std::make_unique<core::StampStore>(fileSystem, stampDir);
  taskRegistry = std::make_unique<core::TaskRegistry>(*stampStore);
  environment = std::make_unique<env::Environment>(std::move(envConfig));
  toolRegistry = std::make_unique<env::ToolRegistry>(*environment);
  config["env-descriptor"] = { environment->getDescriptorPath().str() };

  // Declare the tools.
  for (const auto& name: description.getToolNames()) {
    if (!toolRegistry->declareTool(name, error_out))
      return false;
  }
  for (const auto& entry: description.getPackages()) {
    if (!toolRegistry->setPackage(entry.first, entry.second, error_out))
      return false;
  }
  for (const auto& entry: description.getToolRequires()) {
    // A tool prerequisite names another tool, or a path.
    std::string prerequisite;
    if (const env::Tool* tool = toolRegistry->lookupTool(entry.second)) {
      prerequisite = tool->getCommandPath().str();
    } else {
      prerequisite = resolvePath(baseDir, entry.second);
    }
    if (!toolRegistry->setPrerequisite(entry.first, prerequisite, error_out))
      return false;
  }

  // Every definition must be of a listed task.
  llvm::StringSet<> listedTasks;
  for (const auto& name: description.getTaskNames())
    listedTasks.insert(name);
  for (const auto& definition: description.getTaskDefinitions()) {
    if (!listedTasks.count(definition.name)) {
      *error_out = "command for undeclared task '" + definition.name + "'";
      return false;
    }
  }

  // Declare the tasks.
  for (const auto& name: description.getTaskNames()) {
    if (taskRegistry->lookupTask(name))
      continue;

    core::CleanOverride cleanOverride;
    if (const TaskDefinition* definition =
          description.lookupTaskDefinition(name)) {
      cleanOverride.name = definition->cleanName;
      if (definition->hasCleanCommands) {
        std::vector<std::string> commands;
        for (const auto& command: definition->clean) {
          std::string expanded;
          if (!expandCommand(command, expanded, error_out))
            return false;
          commands.push_back(std::move(expanded));
        }
        cleanOverride.operation =
          core::createCommandCleanOperation(std::move(commands));
      }
    }

    if (!taskRegistry->declareTask(name, std::move(cleanOverride), error_out))
      return false;
  }

  // Define the run operations.
  for (const auto& definition: description.getTaskDefinitions()) {
    core::RunOperation operation;
    for (const auto& input: definition.inputs)
      operation.inputs.push_back(resolvePath(baseDir, input));
    operation.requiredTasks = definition.requiredTasks;
    for (const auto& name: definition.tools) {
      const env::Tool* tool = toolRegistry->lookupTool(name);
      if (!tool) {
        *error_out = "task '" + definition.name +
          "' uses undeclared tool '" + name + "'";
        return false;
      }
      operation.requiredTools.push_back(tool->getCommandPath().str());
    }
    for (const auto& command: definition.run) {
      std::string expanded;
      if (!expandCommand(command, expanded, error_out))
        return false;
      operation.commands.push_back(std::move(expanded));
    }

    if (!taskRegistry->defineRunOperation(definition.name,
                                          std::move(operation), error_out))
      return false;
  }

  return taskRegistry->finalizeRegistration(error_out);
}

bool Project::addRules(core::TaskEngine& engine, std::string* error_out) {
  if (!environment->addRules(engine, error_out))
    return false;
  return toolRegistry->addRules(engine, error_out);
}

bool Project::buildTarget(core::TaskEngine& engine, StringRef target) {
  if (target == "clean")
    return engine.cleanAll();

  if (target == "env-realclean") {
    std::string error;
    if (!environment->removeAll(stampStore->getFileSystem(), &error)) {
      engine.getDelegate().error(error);
      return false;
    }
    return true;
  }

  if (taskRegistry->lookupTask(target))
    return engine.runTask(target);
  if (const core::Task* task = taskRegistry->lookupTaskByCleanName(target))
    return engine.cleanTask(task->getName());

  return engine.build(target);
}

bool Project::expandCommand(StringRef command, std::string& result_out,
                            std::string* error_out) const {
  result_out.clear();
  while (!command.empty()) {
    size_t pos = command.find('$');
    result_out += command.substr(0, pos).str();
    if (pos == StringRef::npos)
      break;
    command = command.substr(pos + 1);

    if (command.startswith("$")) {
      result_out += '$';
      command = command.substr(1);
      continue;
    }

    // Anything other than a braced reference is left for the shell.
    if (!command.startswith("{")) {
      result_out += '$';
      continue;
    }

    size_t end = command.find('}');
    if (end == StringRef::npos) {
      *error_out = "unterminated reference in command '" +
        command.str() + "'";
      return false;
    }

    StringRef key = command.substr(1, end - 1);
    command = command.substr(end + 1);
    if (isConfigKey(key)) {
      result_out += getConfigValue(key);
    } else if (const env::Tool* tool = toolRegistry->lookupTool(key)) {
      result_out += tool->getCommandPath().str();
    } else if (key == environment->getConfig().installer) {
      result_out += environment->getInstallerPath();
    } else {
      *error_out = "unknown reference '${" + key.str() + "}' in command";
      return false;
    }
  }
  return true;
}
