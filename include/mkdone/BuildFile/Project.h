//===- Project.h ------------------------------------------------*- C++ -*-===//
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
// This file declares the configured form of a manifest: the stamp store, task
// registry, environment and tool registry it describes.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_BUILDFILE_PROJECT_H
#define MKDONE_BUILDFILE_PROJECT_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace core {

class StampStore;
class TaskEngine;
class TaskRegistry;

}

namespace env {

class Environment;
class ToolRegistry;

}

namespace buildfile {

class BuildDescription;

/// A configuration override, as given on the command line.
typedef std::pair<std::string, std::string> ConfigOverride;

/// Parse a "key=value" command line argument.
///
/// \returns False if \arg argument is not of that form.
bool parseConfigOverride(StringRef argument, ConfigOverride& override_out);

/// A fully configured project.
class Project {
  /// The resolved configuration values.
  llvm::StringMap<std::vector<std::string>> config;

  std::unique_ptr<core::StampStore> stampStore;

  std::unique_ptr<core::TaskRegistry> taskRegistry;

  std::unique_ptr<env::Environment> environment;

  std::unique_ptr<env::ToolRegistry> toolRegistry;

  Project(const Project&) MKDONE_DELETED_FUNCTION;
  void operator=(const Project&) MKDONE_DELETED_FUNCTION;

  Project();

  bool configure(const BuildDescription& description,
                 ArrayRef<ConfigOverride> overrides, StringRef baseDir,
                 basic::FileSystem& fileSystem, std::string* error_out);

public:
  ~Project();

  /// Create a project from a loaded manifest.
  ///
  /// Tasks are declared in the order they are listed, with their definitions
  /// from the 'commands' section, and the registry is finalized.
  ///
  /// \param overrides Values replacing those of the 'config' section.
  /// \param baseDir The directory relative paths are resolved against.
  /// \param error_out [out] Error string if the return value is null.
  static std::unique_ptr<Project> create(const BuildDescription& description,
                                         ArrayRef<ConfigOverride> overrides,
                                         StringRef baseDir,
                                         basic::FileSystem& fileSystem,
                                         std::string* error_out);

  /// Get the configuration values for \arg key, joined with spaces.
  std::string getConfigValue(StringRef key) const;

  core::StampStore& getStampStore() { return *stampStore; }

  core::TaskRegistry& getTaskRegistry() { return *taskRegistry; }

  env::Environment& getEnvironment() { return *environment; }

  env::ToolRegistry& getToolRegistry() { return *toolRegistry; }

  /// Add the environment and tool rules to \arg engine.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool addRules(core::TaskEngine& engine, std::string* error_out);

  /// Execute the command line target \arg target with \arg engine.
  ///
  /// The names "clean" and "env-realclean" are matched first, then task
  /// names, then clean names. Anything else is built as a path, including
  /// the "<tool>-install" and "env" aliases. Failures are reported through
  /// the engine delegate.
  bool buildTarget(core::TaskEngine& engine, StringRef target);

  /// Expand references in \arg command.
  ///
  /// "${key}" expands to a configuration value or to the command path of the
  /// declared tool "key"; "$$" expands to "$".
  ///
  /// \param error_out [out] Error string if return value is false.
  bool expandCommand(StringRef command, std::string& result_out,
                     std::string* error_out) const;
};

}
}

#endif
