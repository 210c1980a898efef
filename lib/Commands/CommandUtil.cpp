//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "CommandUtil.h"
#include "ConsoleDelegate.h"
#include "mkdone/Commands/Commands.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/LLVM.h"
#include "mkdone/Basic/PlatformUtility.h"
#include "mkdone/BuildFile/BuildDescription.h"
#include "mkdone/BuildFile/BuildFile.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cctype>
#include <cerrno>
#include <cstdio>

using namespace mkdone;
using namespace mkdone::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  assert(programName.empty());
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return nullptr;

  return programName.c_str();
}

void util::emitError(StringRef filename, StringRef message,
                     const char* position, unsigned length,
                     StringRef buffer) {
  assert(position >= buffer.begin() && position <= buffer.end() &&
         "invalid position");
  assert(position + length <= buffer.end() && "invalid length");

  // Compute the line and column.
  int line = 1;
  int column = 0;
  for (const char *c = buffer.begin(); c != position; ++c) {
    if (*c == '\n') {
      ++line;
      column = 0;
    } else {
      ++column;
    }
  }

  auto& os = llvm::errs();
  os << filename << ":" << line << ":" << column << ": error: " << message
     << "\n";

  // Skip carat diagnostics on EOF token.
  if (position == buffer.end())
    return;

  // Simple caret style diagnostics.
  const char *lineBegin = position, *lineEnd = position;
  const char *bufferBegin = buffer.begin(), *bufferEnd = buffer.end();

  // Run line pointers forward and back.
  while (lineBegin > bufferBegin &&
         lineBegin[-1] != '\r' && lineBegin[-1] != '\n')
    --lineBegin;
  while (lineEnd < bufferEnd &&
         lineEnd[0] != '\r' && lineEnd[0] != '\n')
    ++lineEnd;

  // Show the line, indented by 2.
  os << "  " << StringRef(lineBegin, lineEnd - lineBegin) << "\n";

  // Show the caret or squiggly, making sure to print back spaces the same.
  os << "  ";
  for (const char* s = lineBegin; s != position; ++s)
    os << (isspace(*s) ? *s : ' ');
  if (length > 1) {
    for (unsigned i = 0; i != length; ++i)
      os << '~';
  } else {
    os << '^';
  }
  os << '\n';
}

void util::ProjectInvocation::parse(std::vector<std::string> args,
                                    bool allowJournal) {
  auto consumeValue = [&](const std::string& option,
                          std::string& value_out) -> bool {
    if (args.empty()) {
      fprintf(stderr, "error: %s: missing argument to '%s'\n\n",
              getProgramName(), option.c_str());
      hadErrors = true;
      return false;
    }
    value_out = args[0];
    args.erase(args.begin());
    return true;
  };

  while (!args.empty() && !args[0].empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      showUsage = true;
      return;
    } else if (option == "-f" || option == "--file") {
      if (!consumeValue(option, buildFilePath))
        return;
    } else if (option == "-C" || option == "--directory") {
      if (!consumeValue(option, chdirPath))
        return;
    } else if (allowJournal && option == "--journal") {
      if (!consumeValue(option, journalPath))
        return;
    } else if (option == "-v" || option == "--verbose") {
      verbose = true;
    } else if (option == "-q" || option == "--quiet") {
      quiet = true;
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      hadErrors = true;
      return;
    }
  }

  if (verbose && quiet) {
    fprintf(stderr, "error: %s: '-v' and '-q' are mutually exclusive\n\n",
            getProgramName());
    hadErrors = true;
    return;
  }

  // Separate the configuration overrides from the targets.
  for (const auto& arg: args) {
    buildfile::ConfigOverride override;
    if (buildfile::parseConfigOverride(arg, override)) {
      overrides.push_back(std::move(override));
    } else {
      positionalArgs.push_back(arg);
    }
  }
}

void util::printProjectOptions(bool allowJournal) {
  int optionWidth = 25;
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-f, --file <path>",
          "manifest to load [default: 'mkdone.yaml']");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-C, --directory <path>",
          "change to the given directory first");
  if (allowJournal) {
    fprintf(stderr, "  %-*s %s\n", optionWidth, "--journal <path>",
            "record executed commands in the given database");
  }
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-v, --verbose",
          "echo commands and report up to date targets");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-q, --quiet",
          "only report errors");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "<key>=<value>",
          "override a 'config' entry of the manifest");
}

std::unique_ptr<buildfile::Project>
util::loadProject(const ProjectInvocation& invocation,
                  basic::FileSystem& fileSystem) {
  if (!invocation.chdirPath.empty()) {
    if (!basic::sys::chdir(invocation.chdirPath.c_str())) {
      fprintf(stderr, "error: %s: unable to honor --directory: %s\n",
              getProgramName(), basic::sys::strerror(errno).c_str());
      return nullptr;
    }
  }

  ConsoleBuildFileDelegate delegate(fileSystem);
  buildfile::BuildFile buildFile(invocation.buildFilePath, delegate);
  auto description = buildFile.load();
  if (!description)
    return nullptr;

  std::string error;
  auto project = buildfile::Project::create(
      *description, invocation.overrides,
      llvm::sys::path::parent_path(invocation.buildFilePath), fileSystem,
      &error);
  if (!project) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(), error.c_str());
    return nullptr;
  }
  return project;
}
