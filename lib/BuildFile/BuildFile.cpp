//===-- BuildFile.cpp -----------------------------------------------------===//
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

#include "mkdone/BuildFile/BuildFile.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/BuildFile/BuildDescription.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

using namespace mkdone;
using namespace mkdone::buildfile;

BuildFileDelegate::~BuildFileDelegate() {}

#pragma mark - BuildFile implementation

namespace {

/// The client name expected in the 'client' section.
static const char* const clientName = "mkdone";

/// The newest manifest version understood by the loader.
static const uint32_t currentClientVersion = 1;

class BuildFileImpl {
  /// The name of the main input file.
  std::string mainFilename;

  /// The delegate the BuildFile was configured with.
  BuildFileDelegate& delegate;

  /// The description being loaded.
  std::unique_ptr<BuildDescription> description;

  /// The sections already parsed.
  llvm::StringSet<> seenSections;

  /// The number of parsing errors.
  int numErrors = 0;

  std::string stringFromScalarNode(llvm::yaml::ScalarNode* scalar) {
    SmallString<256> storage;
    return scalar->getValue(storage).str();
  }

  /// Emit an error.
  void error(StringRef filename, llvm::SMRange at,
             const Twine& message) {
    BuildFileToken atToken{at.Start.getPointer(),
        unsigned(at.End.getPointer()-at.Start.getPointer())};
    delegate.error(filename, atToken, message);
    ++numErrors;
  }

  void error(const Twine& message) {
    error(mainFilename, {}, message);
  }

  void error(llvm::yaml::Node* node, const Twine& message) {
    error(mainFilename, node->getSourceRange(), message);
  }

  bool nodeIsScalarString(llvm::yaml::Node* node, StringRef name) {
    if (node->getType() != llvm::yaml::Node::NK_Scalar)
      return false;

    return stringFromScalarNode(
        static_cast<llvm::yaml::ScalarNode*>(node)) == name;
  }

  /// Parse a scalar, or a sequence of scalars, into \arg values_out.
  bool parseStringList(llvm::yaml::Node* node, StringRef context,
                       std::vector<std::string>& values_out) {
    if (node->getType() == llvm::yaml::Node::NK_Scalar) {
      values_out.push_back(stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(node)));
      return true;
    }

    if (node->getType() != llvm::yaml::Node::NK_Sequence) {
      error(node, "invalid value type for " + context +
            " (expected scalar or list)");
      return false;
    }

    for (auto& item: *static_cast<llvm::yaml::SequenceNode*>(node)) {
      if (item.getType() != llvm::yaml::Node::NK_Scalar) {
        error(&item, "invalid item type for " + context + " (expected scalar)");
        return false;
      }
      values_out.push_back(stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(&item)));
    }
    return true;
  }

  /// Parse a mapping of scalars to scalars.
  bool parsePropertyMapping(llvm::yaml::Node* node, StringRef section,
                            BuildDescription::property_list& properties_out) {
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected '" + section + "' value (expected map)");
      return false;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in '" + section + "' map");
        return false;
      }
      if (entry.getValue()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getValue(), "invalid value type in '" + section + "' map");
        return false;
      }

      properties_out.push_back({
          stringFromScalarNode(
              static_cast<llvm::yaml::ScalarNode*>(entry.getKey())),
          stringFromScalarNode(
              static_cast<llvm::yaml::ScalarNode*>(entry.getValue())) });
    }
    return true;
  }

  bool parseRootNode(llvm::yaml::Node* node) {
    // The root must always be a mapping.
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected top-level node");
      return false;
    }
    auto mapping = static_cast<llvm::yaml::MappingNode*>(node);

    // The client section must come first.
    auto it = mapping->begin();
    if (it == mapping->end()) {
      error(node, "expected initial mapping key 'client'");
      return false;
    }
    if (!nodeIsScalarString(it->getKey(), "client")) {
      error(it->getKey(), "expected initial mapping key 'client'");
      return false;
    }
    if (it->getValue()->getType() != llvm::yaml::Node::NK_Mapping) {
      error(it->getValue(), "unexpected 'client' value (expected map)");
      return false;
    }
    if (!parseClientMapping(
            static_cast<llvm::yaml::MappingNode*>(it->getValue()))) {
      return false;
    }
    ++it;

    // The remaining sections may appear in any order, each at most once.
    for (; it != mapping->end(); ++it) {
      if (it->getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(it->getKey(), "invalid top-level section key");
        return false;
      }
      std::string section = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(it->getKey()));
      if (!seenSections.insert(section).second) {
        error(it->getKey(), "duplicate '" + section + "' section");
        return false;
      }

      llvm::yaml::Node* value = it->getValue();
      bool success;
      if (section == "config") {
        success = parseConfigMapping(value);
      } else if (section == "tasks") {
        success = parseStringList(value, "'tasks'",
                                  description->getTaskNames());
      } else if (section == "tools") {
        success = parseStringList(value, "'tools'",
                                  description->getToolNames());
      } else if (section == "packages") {
        success = parsePropertyMapping(value, section,
                                       description->getPackages());
      } else if (section == "tool-requires") {
        success = parsePropertyMapping(value, section,
                                       description->getToolRequires());
      } else if (section == "commands") {
        success = parseCommandsMapping(value);
      } else {
        error(it->getKey(), "unexpected top-level section '" + section + "'");
        return false;
      }
      if (!success)
        return false;
    }

    return true;
  }

  bool parseClientMapping(llvm::yaml::MappingNode* map) {
    std::string name;
    uint32_t version = 0;

    for (auto& entry: *map) {
      // All keys and values must be scalar.
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in 'client' map");
        return false;
      }
      if (entry.getValue()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getValue(), "invalid value type in 'client' map");
        return false;
      }

      std::string key = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getKey()));
      std::string value = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getValue()));
      if (key == "name") {
        name = value;
      } else if (key == "version") {
        if (StringRef(value).getAsInteger(10, version)) {
          error(entry.getValue(), "invalid version number in 'client' map");
          return false;
        }
      } else {
        error(entry.getKey(), "unexpected key '" + key + "' in 'client' map");
        return false;
      }
    }

    if (name != clientName) {
      error(map, "unsupported client '" + name + "' (expected '" +
            clientName + "')");
      return false;
    }
    if (version > currentClientVersion) {
      error(map, "unsupported client version " + Twine(version));
      return false;
    }

    description->getClientName() = name;
    description->getClientVersion() = version;
    return true;
  }

  bool parseConfigMapping(llvm::yaml::Node* node) {
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected 'config' value (expected map)");
      return false;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in 'config' map");
        return false;
      }

      std::string key = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getKey()));
      BuildDescription::value_list values;
      if (!parseStringList(entry.getValue(), "'" + key + "'", values))
        return false;
      description->getConfig().push_back({ key, std::move(values) });
    }
    return true;
  }

  bool parseCommandsMapping(llvm::yaml::Node* node) {
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected 'commands' value (expected map)");
      return false;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      // Every key must be scalar.
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in 'commands' map");
        continue;
      }
      // Every value must be a mapping.
      if (entry.getValue()->getType() != llvm::yaml::Node::NK_Mapping) {
        error(entry.getValue(), "invalid value type in 'commands' map");
        continue;
      }

      TaskDefinition definition;
      definition.name = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getKey()));

      // Check that the command is not a duplicate.
      if (description->lookupTaskDefinition(definition.name)) {
        error(entry.getKey(), "duplicate command in 'commands' map");
        continue;
      }

      // The attribute map may be left mid parse, so stop here.
      if (!parseTaskAttributes(
              static_cast<llvm::yaml::MappingNode*>(entry.getValue()),
              definition)) {
        return false;
      }
      description->getTaskDefinitions().push_back(std::move(definition));
    }

    return numErrors == 0;
  }

  bool parseTaskAttributes(llvm::yaml::MappingNode* attrs,
                           TaskDefinition& definition) {
    for (auto& attr: *attrs) {
      if (attr.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(attr.getKey(), "invalid key type for command in 'commands' map");
        return false;
      }

      std::string key = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(attr.getKey()));
      llvm::yaml::Node* value = attr.getValue();
      bool success;
      if (key == "inputs") {
        success = parseStringList(value, "'inputs'", definition.inputs);
      } else if (key == "requires") {
        success = parseStringList(value, "'requires'",
                                  definition.requiredTasks);
      } else if (key == "tools") {
        success = parseStringList(value, "'tools'", definition.tools);
      } else if (key == "run") {
        success = parseStringList(value, "'run'", definition.run);
      } else if (key == "clean") {
        definition.hasCleanCommands = true;
        success = parseStringList(value, "'clean'", definition.clean);
      } else if (key == "clean-name") {
        if (value->getType() != llvm::yaml::Node::NK_Scalar) {
          error(value, "invalid value type for 'clean-name' (expected scalar)");
          return false;
        }
        definition.cleanName = stringFromScalarNode(
            static_cast<llvm::yaml::ScalarNode*>(value));
        success = true;
      } else {
        error(attr.getKey(), "unexpected attribute '" + key + "' for command '" +
              definition.name + "'");
        return false;
      }
      if (!success)
        return false;
    }
    return true;
  }

public:
  BuildFileImpl(const std::string& mainFilename,
                BuildFileDelegate& delegate)
    : mainFilename(mainFilename), delegate(delegate) {}

  ~BuildFileImpl() {}

  BuildFileDelegate* getDelegate() {
    return &delegate;
  }

  /// @name Parse Actions
  /// @{

  std::unique_ptr<BuildDescription> load() {
    // Create a memory buffer for the input.
    llvm::SourceMgr sourceMgr;
    auto input = delegate.getFileSystem().getFileContents(mainFilename);
    if (!input) {
      error("unable to open '" + mainFilename + "'");
      return nullptr;
    }

    delegate.setFileContentsBeingParsed(input->getBuffer());

    // Route syntax errors through the delegate.
    sourceMgr.setDiagHandler([](const llvm::SMDiagnostic& diagnostic,
                                void* context) {
        auto impl = static_cast<BuildFileImpl*>(context);
        impl->error(impl->mainFilename,
                    llvm::SMRange(diagnostic.getLoc(), diagnostic.getLoc()),
                    diagnostic.getMessage());
      }, this);

    // Create a YAML parser.
    llvm::yaml::Stream stream(input->getMemBufferRef(), sourceMgr);

    description = std::make_unique<BuildDescription>();
    seenSections.clear();
    numErrors = 0;

    // Read the stream, we only expect a single document.
    auto it = stream.begin();
    if (it == stream.end()) {
      error("missing document in stream");
      return nullptr;
    }

    auto& document = *it;
    auto root = document.getRoot();
    if (!root || numErrors) {
      if (!numErrors)
        error("missing document in stream");
      return nullptr;
    }

    if (!parseRootNode(root) || numErrors) {
      return nullptr;
    }

    if (++it != stream.end()) {
      error(it->getRoot(), "unexpected additional document in stream");
      return nullptr;
    }

    if (stream.failed() || numErrors) {
      return nullptr;
    }

    return std::move(description);
  }

  /// @}
};

}

#pragma mark - BuildFile

BuildFile::BuildFile(StringRef mainFilename,
                     BuildFileDelegate& delegate)
  : impl(new BuildFileImpl(mainFilename.str(), delegate))
{
}

BuildFile::~BuildFile() {
  delete static_cast<BuildFileImpl*>(impl);
}

BuildFileDelegate* BuildFile::getDelegate() {
  return static_cast<BuildFileImpl*>(impl)->getDelegate();
}

std::unique_ptr<BuildDescription> BuildFile::load() {
  return static_cast<BuildFileImpl*>(impl)->load();
}
