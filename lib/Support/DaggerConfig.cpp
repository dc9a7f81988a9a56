//===- DaggerConfig.cpp - Relation rule configuration ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements loading of repo-dagger configuration files.
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/DaggerConfig.h"
#include "dagger/Support/Glob.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SHA256.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace dagger;

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

llvm::Error configError(const llvm::Twine &message) {
  return llvm::make_error<llvm::StringError>(
      message, std::make_error_code(std::errc::invalid_argument));
}

/// Records the first diagnostic reported by the YAML parser.
struct YAMLDiagnostics {
  std::string message;

  static void handle(const llvm::SMDiagnostic &diag, void *context) {
    auto *self = static_cast<YAMLDiagnostics *>(context);
    if (!self->message.empty())
      return;
    self->message = ("line " + llvm::Twine(diag.getLineNo()) + ": " +
                     diag.getMessage())
                        .str();
  }
};

/// True for an absent value, `~` and `null`.
bool isNull(llvm::yaml::Node *node) {
  if (!node || llvm::isa<llvm::yaml::NullNode>(node))
    return true;
  if (auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node)) {
    auto raw = scalar->getRawValue();
    return raw == "~" || raw == "null" || raw == "Null" || raw == "NULL";
  }
  return false;
}

/// Parse a string field. A null value yields the empty string.
llvm::Error parseString(llvm::yaml::Node *node, llvm::StringRef field,
                        std::string &out) {
  if (isNull(node)) {
    out.clear();
    return llvm::Error::success();
  }
  auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node);
  if (!scalar)
    return configError("field '" + field + "': expected a string");
  llvm::SmallString<128> storage;
  out = scalar->getValue(storage).str();
  return llvm::Error::success();
}

/// Parse a field holding either one string or a sequence of strings.
llvm::Error parseStringList(llvm::yaml::Node *node, llvm::StringRef field,
                            std::vector<std::string> &out) {
  out.clear();
  if (isNull(node))
    return llvm::Error::success();

  llvm::SmallString<128> storage;
  if (auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node)) {
    out.push_back(scalar->getValue(storage).str());
    return llvm::Error::success();
  }

  auto *seq = llvm::dyn_cast<llvm::yaml::SequenceNode>(node);
  if (!seq)
    return configError("field '" + field +
                       "': expected string or list of strings");
  for (auto &item : *seq) {
    auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(&item);
    if (!scalar || isNull(scalar))
      return configError("field '" + field +
                         "': expected string or list of strings");
    out.push_back(scalar->getValue(storage).str());
  }
  return llvm::Error::success();
}

/// Parse a boolean field.
llvm::Error parseBool(llvm::yaml::Node *node, llvm::StringRef field,
                      bool &out) {
  if (isNull(node)) {
    out = false;
    return llvm::Error::success();
  }
  auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node);
  if (scalar) {
    llvm::SmallString<16> storage;
    auto value = scalar->getValue(storage);
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "on") {
      out = true;
      return llvm::Error::success();
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "off") {
      out = false;
      return llvm::Error::success();
    }
  }
  return configError("field '" + field + "': expected a boolean");
}

/// Parse a YAML mapping node with a callback for each key-value pair. Keys
/// must be unique strings.
llvm::Error parseMapping(
    llvm::yaml::MappingNode *mapping, llvm::StringRef context,
    llvm::function_ref<llvm::Error(llvm::StringRef, llvm::yaml::Node *)> cb) {
  llvm::StringSet<> seen;
  for (auto &entry : *mapping) {
    auto *keyNode = llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(
        entry.getKey());
    if (!keyNode)
      return configError(context + ": mapping keys must be strings");

    llvm::SmallString<64> keyStorage;
    llvm::StringRef key = keyNode->getValue(keyStorage);
    if (!seen.insert(key).second)
      return configError(context + ": duplicate key '" + key + "'");

    if (auto err = cb(key, entry.getValue()))
      return err;
  }
  return llvm::Error::success();
}

/// Parse one action field. Sets `known` to false for keys that are not
/// actions.
llvm::Error parseActionField(llvm::StringRef key, llvm::yaml::Node *value,
                             RuleActions &actions, bool &known) {
  known = true;
  if (key == "visit")
    return parseStringList(value, key, actions.visit);
  if (key == "visit_siblings")
    return parseStringList(value, key, actions.visitSiblings);
  if (key == "visit_grand_siblings")
    return parseStringList(value, key, actions.visitGrandSiblings);
  if (key == "visit_imported_python_modules")
    return parseBool(value, key, actions.visitImportedPythonModules);
  if (key == "visit_python_all_submodules_for")
    return parseStringList(value, key, actions.visitPythonAllSubmodulesFor);
  if (key == "exclude")
    return parseStringList(value, key, actions.exclude);
  known = false;
  return llvm::Error::success();
}

llvm::Error parseRuleActions(llvm::yaml::Node *node, const std::string &context,
                             RuleActions &actions, PathRule *owner);

/// Parse the `regex_rules` section of a path rule.
llvm::Error parseRegexRules(llvm::yaml::Node *node, PathRule &rule) {
  if (isNull(node))
    return llvm::Error::success();

  std::string context = "path rule '" + rule.pattern + "'";
  auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(node);
  if (!mapping)
    return configError(context + ": field 'regex_rules': expected a mapping");

  return parseMapping(
      mapping, context,
      [&](llvm::StringRef pattern, llvm::yaml::Node *value) -> llvm::Error {
        RegexRule regexRule;
        regexRule.pattern = pattern.str();
        if (auto err = parseRuleActions(value,
                                        "regex rule '" + regexRule.pattern +
                                            "' in " + context,
                                        regexRule.actions, nullptr))
          return err;
        rule.regexRules.push_back(std::move(regexRule));
        return llvm::Error::success();
      });
}

/// Parse an actions block. `owner` is set for path rules, which may also
/// carry regex rules.
llvm::Error parseRuleActions(llvm::yaml::Node *node, const std::string &context,
                             RuleActions &actions, PathRule *owner) {
  if (isNull(node))
    return llvm::Error::success();

  auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(node);
  if (!mapping)
    return configError(context + ": expected a mapping");

  return parseMapping(
      mapping, context,
      [&](llvm::StringRef key, llvm::yaml::Node *value) -> llvm::Error {
        bool known = false;
        if (auto err = parseActionField(key, value, actions, known))
          return configError(context + ": " + llvm::toString(std::move(err)));
        if (known)
          return llvm::Error::success();
        if (owner && key == "regex_rules")
          return parseRegexRules(value, *owner);
        return configError(context + ": unknown field '" + key + "'");
      });
}

/// Write a double-quoted YAML string.
void writeQuoted(llvm::raw_ostream &os, llvm::StringRef value) {
  os << '"' << llvm::yaml::escape(value) << '"';
}

void writeList(llvm::raw_ostream &os, llvm::StringRef indent,
               llvm::StringRef key, const std::vector<std::string> &values,
               bool skipEmpty) {
  if (values.empty()) {
    if (!skipEmpty)
      os << indent << key << ": []\n";
    return;
  }
  os << indent << key << ":\n";
  for (const auto &value : values) {
    os << indent << "  - ";
    writeQuoted(os, value);
    os << '\n';
  }
}

void writeActions(llvm::raw_ostream &os, llvm::StringRef indent,
                  const RuleActions &actions) {
  writeList(os, indent, "visit", actions.visit, /*skipEmpty=*/true);
  writeList(os, indent, "visit_siblings", actions.visitSiblings,
            /*skipEmpty=*/true);
  writeList(os, indent, "visit_grand_siblings", actions.visitGrandSiblings,
            /*skipEmpty=*/true);
  if (actions.visitImportedPythonModules)
    os << indent << "visit_imported_python_modules: true\n";
  writeList(os, indent, "visit_python_all_submodules_for",
            actions.visitPythonAllSubmodulesFor, /*skipEmpty=*/true);
  writeList(os, indent, "exclude", actions.exclude, /*skipEmpty=*/true);
}

} // namespace

//===----------------------------------------------------------------------===//
// DaggerConfig Implementation
//===----------------------------------------------------------------------===//

DaggerConfig::DaggerConfig() = default;
DaggerConfig::~DaggerConfig() = default;

llvm::Expected<std::unique_ptr<DaggerConfig>>
DaggerConfig::loadFromFile(llvm::StringRef filePath) {
  auto fileOrErr =
      llvm::MemoryBuffer::getFile(filePath, /*IsText=*/false,
                                  /*RequiresNullTerminator=*/false);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to read config file '%s': %s",
                                   filePath.str().c_str(),
                                   ec.message().c_str());

  auto result = loadFromYAML((*fileOrErr)->getBuffer());
  if (!result)
    return result.takeError();

  // Relative base directories are anchored at the config file's directory.
  llvm::SmallString<256> absPath(filePath);
  if (auto ec = llvm::sys::fs::make_absolute(absPath))
    return llvm::createStringError(ec, "failed to resolve path '%s': %s",
                                   filePath.str().c_str(),
                                   ec.message().c_str());
  llvm::sys::path::remove_dots(absPath, /*remove_dot_dot=*/true);
  (*result)->setRootDirectory(llvm::sys::path::parent_path(absPath));

  return result;
}

llvm::Expected<std::unique_ptr<DaggerConfig>>
DaggerConfig::loadFromYAML(llvm::StringRef yamlContent) {
  auto config = std::make_unique<DaggerConfig>();
  config->configHash =
      llvm::SHA256::hash(llvm::arrayRefFromStringRef(yamlContent));

  // Handle empty content as valid empty config
  if (yamlContent.trim().empty())
    return std::move(config);

  // Syntax errors only surface while nodes are parsed, so check the whole
  // stream before interpreting it.
  llvm::SourceMgr srcMgr;
  YAMLDiagnostics diags;
  srcMgr.setDiagHandler(YAMLDiagnostics::handle, &diags);
  {
    llvm::yaml::Stream check(yamlContent, srcMgr, /*ShowColors=*/false);
    if (!check.validate())
      return configError("failed to decode config: " + diags.message);
  }

  llvm::yaml::Stream stream(yamlContent, srcMgr, /*ShowColors=*/false);
  auto docIt = stream.begin();
  if (docIt == stream.end())
    return std::move(config);

  llvm::yaml::Node *rootNode = docIt->getRoot();
  if (isNull(rootNode))
    return std::move(config);

  auto *root = llvm::dyn_cast<llvm::yaml::MappingNode>(rootNode);
  if (!root)
    return configError("failed to decode config: root must be a mapping");

  auto err = parseMapping(
      root, "config",
      [&](llvm::StringRef key, llvm::yaml::Node *value) -> llvm::Error {
        if (key == "base_dir")
          return parseString(value, key, config->baseDir);
        if (key == "inputs")
          return parseStringList(value, key, config->inputs);
        if (key == "global_deps")
          return parseStringList(value, key, config->globalDeps);
        if (key == "global_exclude")
          return parseStringList(value, key, config->globalExclude);
        if (key == "root_python_packages")
          return parseStringList(value, key, config->rootPythonPackages);
        if (key == "path_rules") {
          if (isNull(value))
            return llvm::Error::success();
          auto *rules = llvm::dyn_cast<llvm::yaml::MappingNode>(value);
          if (!rules)
            return configError("field 'path_rules': expected a mapping");
          return parseMapping(
              rules, "path_rules",
              [&](llvm::StringRef pattern,
                  llvm::yaml::Node *ruleNode) -> llvm::Error {
                PathRule rule;
                rule.pattern = pattern.str();
                if (auto ruleErr =
                        parseRuleActions(ruleNode,
                                         "path rule '" + rule.pattern + "'",
                                         rule.actions, &rule))
                  return ruleErr;
                config->pathRules.push_back(std::move(rule));
                return llvm::Error::success();
              });
        }
        return configError("unknown field '" + key + "'");
      });
  if (err)
    return configError("failed to decode config: " +
                       llvm::toString(std::move(err)));

  if (stream.failed())
    return configError("failed to decode config: " + diags.message);

  return std::move(config);
}

//===----------------------------------------------------------------------===//
// Resolution Methods
//===----------------------------------------------------------------------===//

std::string DaggerConfig::getResolvedBaseDir() const {
  llvm::SmallString<256> path;
  if (llvm::sys::path::is_absolute(baseDir)) {
    path = baseDir;
  } else {
    path = rootDirectory;
    llvm::sys::path::append(path, baseDir);
  }
  llvm::sys::path::remove_dots(path, /*remove_dot_dot=*/true);
  if (path.empty())
    return ".";
  return path.str().str();
}

bool DaggerConfig::isInRootPythonPackage(llvm::StringRef module) const {
  return llvm::any_of(rootPythonPackages, [&](const std::string &package) {
    llvm::StringRef rest = module;
    return rest.consume_front(package) && (rest.empty() || rest.front() == '.');
  });
}

llvm::Expected<std::vector<std::string>>
DaggerConfig::resolveInputFiles() const {
  std::string base = getResolvedBaseDir();
  std::vector<std::string> files;
  for (const auto &input : inputs) {
    auto matches = expandGlob(base, input);
    if (!matches)
      return llvm::createStringError(
          std::errc::invalid_argument,
          "error while collecting input files: glob '%s': %s", input.c_str(),
          llvm::toString(matches.takeError()).c_str());
    files.insert(files.end(), matches->begin(), matches->end());
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

//===----------------------------------------------------------------------===//
// Serialization
//===----------------------------------------------------------------------===//

std::string DaggerConfig::toYAML() const {
  std::string yaml;
  llvm::raw_string_ostream os(yaml);

  os << "base_dir: ";
  writeQuoted(os, baseDir);
  os << '\n';
  writeList(os, "", "inputs", inputs, /*skipEmpty=*/false);
  writeList(os, "", "global_deps", globalDeps, /*skipEmpty=*/false);
  writeList(os, "", "global_exclude", globalExclude, /*skipEmpty=*/false);
  writeList(os, "", "root_python_packages", rootPythonPackages,
            /*skipEmpty=*/false);

  if (pathRules.empty()) {
    os << "path_rules: {}\n";
    return os.str();
  }

  os << "path_rules:\n";
  for (const auto &rule : pathRules) {
    os << "  ";
    writeQuoted(os, rule.pattern);
    os << ":\n";
    writeActions(os, "    ", rule.actions);
    if (rule.regexRules.empty())
      continue;
    os << "    regex_rules:\n";
    for (const auto &regexRule : rule.regexRules) {
      os << "      ";
      writeQuoted(os, regexRule.pattern);
      os << ":\n";
      writeActions(os, "        ", regexRule.actions);
    }
  }

  return os.str();
}
