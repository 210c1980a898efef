//===- MockTaskEngineDelegate.h ---------------------------------*- C++ -*-===//
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

#include "TempDir.h"

#include "mkdone/Basic/LLVM.h"
#include "mkdone/Basic/Subprocess.h"
#include "mkdone/Core/TaskEngine.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

namespace mkdone {
namespace unittests {

/// A command runner which records each command instead of spawning a shell.
///
/// Commands succeed unless listed as failing, and a command may be given a
/// file to produce when it runs.
class MockCommandRunner : public basic::CommandRunner {
  std::vector<std::string> commands;

  llvm::StringSet<> failingCommands;

  llvm::StringMap<std::string> outputs;

public:
  const std::vector<std::string>& getCommands() const { return commands; }

  void clearCommands() { commands.clear(); }

  void setFails(StringRef command, bool fails = true) {
    if (fails)
      failingCommands.insert(command);
    else
      failingCommands.erase(command);
  }

  /// Make \arg command write the file at \arg path when it runs.
  void setOutput(StringRef command, StringRef path) {
    outputs[command] = path.str();
  }

  virtual basic::ProcessResult
  executeShellCommand(StringRef command) override {
    commands.push_back(command.str());

    basic::ProcessResult result;
    if (failingCommands.count(command)) {
      result.exitStatus = 1;
      return result;
    }

    auto it = outputs.find(command);
    if (it != outputs.end())
      writeFile(it->second, command);
    return result;
  }
};

class MockTaskEngineDelegate : public core::TaskEngineDelegate {
  std::vector<std::string> messages;

  bool trackAllMessages;

public:
  MockTaskEngineDelegate(bool trackAllMessages = false)
    : trackAllMessages(trackAllMessages) {}

  const std::vector<std::string>& getMessages() const { return messages; }

  void clearMessages() { messages.clear(); }

  virtual void ruleStarted(const core::Rule& rule,
                           const core::Staleness&) override {
    if (trackAllMessages)
      messages.push_back(("ruleStarted(" + rule.getName() + ")").str());
  }

  virtual void ruleUpToDate(const core::Rule& rule) override {
    if (trackAllMessages)
      messages.push_back(("ruleUpToDate(" + rule.getName() + ")").str());
  }

  virtual void commandStarted(StringRef owner, StringRef command) override {
    if (trackAllMessages)
      messages.push_back(("commandStarted(" + owner + ") " + command).str());
  }

  virtual void commandFinished(StringRef owner, StringRef,
                               const basic::ProcessResult& result) override {
    if (trackAllMessages)
      messages.push_back(("commandFinished(" + owner + ": " +
                          Twine(result.exitStatus) + ")").str());
  }

  virtual void error(const Twine& message) override {
    llvm::errs() << "error: " << message << "\n";
    messages.push_back(message.str());
  }

  virtual void note(const Twine& message) override {
    if (trackAllMessages)
      messages.push_back(("note " + message).str());
  }

  virtual void cycleDetected(ArrayRef<const core::Rule*> cycle) override {
    std::string message = "cycle";
    for (const auto* rule: cycle) {
      message += " -> ";
      message += rule->getName().str();
    }
    llvm::errs() << "error: " << message << "\n";
    messages.push_back(message);
  }
};

}
}
