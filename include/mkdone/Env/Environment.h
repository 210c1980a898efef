//===- Environment.h --------------------------------------------*- C++ -*-===//
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
//
// This file declares the isolated environment into which tools are
// provisioned.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_ENV_ENVIRONMENT_H
#define MKDONE_ENV_ENVIRONMENT_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace core {

class TaskEngine;

}

namespace env {

/// The configuration of an environment.
struct EnvironmentConfig {
  /// The root directory of the environment.
  std::string rootDir;

  /// The file whose existence marks a provisioned environment, or empty for
  /// "<rootDir>/pyvenv.cfg".
  std::string descriptorPath;

  /// The subdirectory of the root holding tool commands.
  std::string binSubpath = "bin";

  /// The commands run to create the environment.
  std::vector<std::string> bootstrapCommands;

  /// Files the bootstrap depends on. These must exist before bootstrapping,
  /// but never cause an existing environment to be recreated.
  std::vector<std::string> bootstrapInputs;

  /// The name of the command, provided by the bootstrap, used to install
  /// packages.
  std::string installer = "pip";

  /// Options passed to the installer, as a shell fragment.
  std::string installOptions;
};

/// An isolated environment of provisioned tools.
///
/// The environment is provisioned at most once: its descriptor file is
/// created by the bootstrap commands, and while it exists the bootstrap never
/// runs again.
class Environment {
  EnvironmentConfig config;

  Environment(const Environment&) MKDONE_DELETED_FUNCTION;
  void operator=(const Environment&) MKDONE_DELETED_FUNCTION;

public:
  explicit Environment(EnvironmentConfig config);

  const EnvironmentConfig& getConfig() const { return config; }

  StringRef getRootDir() const { return config.rootDir; }

  StringRef getDescriptorPath() const { return config.descriptorPath; }

  /// Get the path of the command \arg name within the environment.
  std::string getCommandPath(StringRef name) const;

  std::string getInstallerPath() const {
    return getCommandPath(config.installer);
  }

  /// Get the shell command installing \arg package.
  std::string getInstallCommand(StringRef package) const;

  /// Add the rules provisioning the environment to \arg engine.
  ///
  /// This adds a rule producing the descriptor, a rule for the installer
  /// command and the alias "env" for the descriptor.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool addRules(core::TaskEngine& engine, std::string* error_out) const;

  /// Remove the environment root directory and everything in it.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool removeAll(basic::FileSystem& fileSystem, std::string* error_out) const;
};

}
}

#endif
