//===-- Environment.cpp ---------------------------------------------------===//
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

#include "mkdone/Env/Environment.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/ShellUtility.h"
#include "mkdone/Core/Rule.h"
#include "mkdone/Core/TaskEngine.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace mkdone;
using namespace mkdone::env;

namespace {

/// The rule producing the environment descriptor by running the bootstrap.
class EnvironmentRule : public core::Rule {
  const Environment& environment;

public:
  explicit EnvironmentRule(const Environment& environment)
    : Rule(Kind::Environment, "env", environment.getDescriptorPath(),
           environment.getConfig().bootstrapInputs),
      environment(environment) {}

  virtual bool isExistenceOnly() const override { return true; }

  virtual bool execute(core::RuleCommandInterface& commandInterface) override {
    const auto& commands = environment.getConfig().bootstrapCommands;
    if (commands.empty()) {
      commandInterface.error("no bootstrap commands to create environment '" +
                             environment.getRootDir() + "'");
      return false;
    }

    for (const auto& command: commands) {
      if (!commandInterface.runShellCommand(getName(), command))
        return false;
    }
    return true;
  }
};

/// The rule for the installer, which is provided by the bootstrap.
class InstallerRule : public core::Rule {
public:
  explicit InstallerRule(const Environment& environment)
    : Rule(Kind::Tool, environment.getConfig().installer,
           environment.getInstallerPath(),
           { environment.getDescriptorPath().str() }) {}

  virtual bool isExistenceOnly() const override { return true; }

  virtual bool execute(core::RuleCommandInterface&) override {
    return true;
  }
};

}

Environment::Environment(EnvironmentConfig config) : config(std::move(config)) {
  if (this->config.descriptorPath.empty()) {
    SmallString<256> path(this->config.rootDir);
    llvm::sys::path::append(path, "pyvenv.cfg");
    this->config.descriptorPath = path.str().str();
  }
}

std::string Environment::getCommandPath(StringRef name) const {
  SmallString<256> path(config.rootDir);
  llvm::sys::path::append(path, config.binSubpath, name);
  return path.str().str();
}

std::string Environment::getInstallCommand(StringRef package) const {
  std::string result;
  llvm::raw_string_ostream os(result);
  basic::appendShellEscapedString(os, getInstallerPath());
  os << " install";
  if (!config.installOptions.empty())
    os << " " << config.installOptions;
  os << " ";
  basic::appendShellEscapedString(os, package);
  os.flush();
  return result;
}

bool Environment::addRules(core::TaskEngine& engine,
                           std::string* error_out) const {
  if (!engine.addRule(std::make_unique<EnvironmentRule>(*this), error_out))
    return false;
  if (!engine.addRule(std::make_unique<InstallerRule>(*this), error_out))
    return false;
  return engine.addAlias("env", config.descriptorPath, error_out);
}

bool Environment::removeAll(basic::FileSystem& fileSystem,
                            std::string* error_out) const {
  if (fileSystem.getLinkInfo(config.rootDir).isMissing())
    return true;

  if (!fileSystem.remove(config.rootDir)) {
    *error_out = "unable to remove environment '" + config.rootDir + "'";
    return false;
  }
  return true;
}
