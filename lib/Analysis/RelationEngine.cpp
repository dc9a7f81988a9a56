//===- RelationEngine.cpp - Rule-driven file relations --------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/RelationEngine.h"
#include "dagger/Support/Logging.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <optional>
#include <tuple>

#define DEBUG_TYPE "dagger-relations"

using namespace dagger;

//===----------------------------------------------------------------------===//
// Python Imports
//===----------------------------------------------------------------------===//

namespace {
constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::multiline;

bool isIdentifierStart(char c) { return llvm::isAlpha(c) || c == '_'; }
bool isIdentifierChar(char c) { return llvm::isAlnum(c) || c == '_'; }

/// Append every identifier in the name list of a `from` import.
void splitIdentifiers(llvm::StringRef names,
                      llvm::SmallVectorImpl<llvm::StringRef> &identifiers) {
  while (true) {
    names = names.drop_until([](char c) { return isIdentifierStart(c); });
    if (names.empty())
      return;
    llvm::StringRef name =
        names.take_until([](char c) { return !isIdentifierChar(c); });
    identifiers.push_back(name);
    names = names.drop_front(name.size());
  }
}
} // namespace

PythonImports dagger::parsePythonImports(llvm::StringRef text) {
  llvm::SmallVector<llvm::StringRef> simpleModules;
  llvm::SmallVector<std::pair<llvm::StringRef, llvm::StringRef>> fromImports;

  llvm::StringRef rest = text;
  while (!rest.empty()) {
    llvm::StringRef line;
    std::tie(line, rest) = rest.split('\n');
    llvm::StringRef stmt = line.ltrim(' ');

    // import <module>
    if (stmt.consume_front("import ")) {
      llvm::StringRef module = stmt.take_until([](char c) { return c == ' '; });
      if (!module.empty())
        simpleModules.push_back(module);
      continue;
    }

    // from <module> import <names>
    if (!stmt.consume_front("from "))
      continue;
    llvm::StringRef module = stmt.take_until([](char c) { return c == ' '; });
    llvm::StringRef names = stmt.drop_front(module.size());
    if (module.empty() || !names.consume_front(" import ") || names.empty())
      continue;

    if (names.startswith("(")) {
      // A parenthesized list may span several lines.
      llvm::StringRef list(names.data(), text.end() - names.data());
      size_t close = list.find(')');
      if (close != llvm::StringRef::npos && close > 1) {
        fromImports.push_back({module, list.slice(1, close)});
        rest = list.drop_front(close + 1).split('\n').second;
        continue;
      }
    }
    fromImports.push_back({module, names});
  }

  PythonImports imports;
  for (llvm::StringRef module : simpleModules) {
    imports.modules.push_back(module.str());
    imports.boundNames[module] = module.str();
  }

  for (const auto &fromImport : fromImports) {
    std::string module = fromImport.first.str();
    imports.modules.push_back(module);
    llvm::SmallVector<llvm::StringRef> names;
    splitIdentifiers(fromImport.second, names);
    for (llvm::StringRef name : names) {
      std::string qualified = module + "." + name.str();
      imports.modules.push_back(qualified);
      imports.boundNames[name] = qualified;
    }
  }

  return imports;
}

//===----------------------------------------------------------------------===//
// Capture Substitution
//===----------------------------------------------------------------------===//

std::string dagger::substituteCaptures(llvm::StringRef text,
                                       llvm::ArrayRef<std::string> captures) {
  if (captures.empty())
    return text.str();

  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '$') {
      result.push_back(text[i++]);
      continue;
    }

    size_t digitsEnd = i + 1;
    while (digitsEnd < text.size() && llvm::isDigit(text[digitsEnd]))
      ++digitsEnd;

    // Use the longest digit prefix that names an existing group.
    bool replaced = false;
    for (size_t end = digitsEnd; end > i + 1; --end) {
      unsigned index;
      if (text.slice(i + 1, end).getAsInteger(10, index) ||
          index >= captures.size())
        continue;
      result += captures[index];
      i = end;
      replaced = true;
      break;
    }
    if (!replaced)
      result.push_back(text[i++]);
  }
  return result;
}

std::string dagger::translateRegexSyntax(llvm::StringRef pattern) {
  if (pattern.consume_front("(?m)"))
    LLVM_DEBUG(llvm::dbgs() << "Dropping leading (?m) flag\n");

  std::string result;
  result.reserve(pattern.size());
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\' && i + 1 < pattern.size()) {
      result.push_back(c);
      result.push_back(pattern[++i]);
      continue;
    }
    if (pattern.substr(i, 4) == "(?m:") {
      result += "(?:";
      i += 3;
      continue;
    }
    result.push_back(c);
  }
  return result;
}

//===----------------------------------------------------------------------===//
// RelationEngine
//===----------------------------------------------------------------------===//

/// State of a single visitFile call.
struct RelationEngine::VisitState {
  explicit VisitState(llvm::StringRef file) : file(file) {}

  llvm::StringRef file;
  /// File text, read on first use.
  std::optional<std::string> text;
  /// Imports parsed from `text`, on first use.
  std::optional<PythonImports> imports;
  std::vector<std::string> relations;
};

RelationEngine::RelationEngine(const DaggerConfig &config,
                               llvm::StringRef baseDir,
                               PythonModuleResolver &resolver)
    : config(config), baseDir(baseDir.str()), resolver(resolver) {}

llvm::Expected<const PathGlob *>
RelationEngine::getGlob(llvm::StringRef pattern) {
  auto it = globCache.find(pattern);
  if (it != globCache.end())
    return &it->second;

  auto globOrErr = PathGlob::create(pattern);
  if (!globOrErr)
    return globOrErr.takeError();
  return &globCache.try_emplace(pattern, std::move(*globOrErr)).first->second;
}

llvm::Expected<const std::regex *>
RelationEngine::getRegex(llvm::StringRef pattern) {
  auto it = regexCache.find(pattern);
  if (it != regexCache.end())
    return &it->second;

  std::regex regex;
  try {
    regex = std::regex(translateRegexSyntax(pattern), kRegexFlags);
  } catch (const std::regex_error &e) {
    return llvm::createStringError(std::errc::invalid_argument,
                                   "invalid regular expression: %s", e.what());
  }
  LLVM_DEBUG(llvm::dbgs() << "Compiled regex '" << pattern << "'\n");
  return &regexCache.try_emplace(pattern, std::move(regex)).first->second;
}

llvm::Expected<bool>
RelationEngine::matchesAny(llvm::ArrayRef<std::string> patterns,
                           llvm::StringRef file) {
  for (const auto &pattern : patterns) {
    auto globOrErr = getGlob(pattern);
    if (!globOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument,
          "error matching exclusion '%s' on '%s': %s", pattern.c_str(),
          file.str().c_str(), llvm::toString(globOrErr.takeError()).c_str());
    if ((*globOrErr)->match(file))
      return true;
  }
  return false;
}

llvm::Error RelationEngine::readText(VisitState &state) {
  if (state.text)
    return llvm::Error::success();

  llvm::SmallString<256> path(baseDir);
  llvm::sys::path::append(path, state.file);
  auto bufferOrErr =
      llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                  /*RequiresNullTerminator=*/false);
  if (auto ec = bufferOrErr.getError())
    return llvm::createStringError(ec, "error while reading file '%s': %s",
                                   path.c_str(), ec.message().c_str());
  state.text = (*bufferOrErr)->getBuffer().str();
  return llvm::Error::success();
}

llvm::Error RelationEngine::expandInto(llvm::StringRef dir,
                                       llvm::StringRef pattern,
                                       std::vector<std::string> &out) {
  llvm::SmallString<256> root(baseDir);
  if (dir != ".")
    llvm::sys::path::append(root, dir);

  auto matches = expandGlob(root, pattern);
  if (!matches)
    return matches.takeError();
  for (const auto &match : *matches)
    out.push_back(joinRelative(dir, match));
  return llvm::Error::success();
}

llvm::Error RelationEngine::applyActions(const RuleActions &actions,
                                         VisitState &state,
                                         llvm::ArrayRef<std::string> captures) {
  auto &relations = state.relations;

  for (const auto &visit : actions.visit) {
    std::string pattern = substituteCaptures(visit, captures);
    if (auto err = expandInto(".", pattern, relations))
      return llvm::createStringError(
          std::errc::io_error, "error while visiting '%s': %s",
          pattern.c_str(), llvm::toString(std::move(err)).c_str());
  }

  llvm::StringRef dir = parentDirectory(state.file);
  for (const auto &visit : actions.visitSiblings) {
    std::string pattern = substituteCaptures(visit, captures);
    if (auto err = expandInto(dir, pattern, relations))
      return llvm::createStringError(
          std::errc::io_error, "error while visiting sibling '%s': %s",
          pattern.c_str(), llvm::toString(std::move(err)).c_str());
  }

  if (!actions.visitGrandSiblings.empty()) {
    std::vector<std::string> patterns;
    for (const auto &visit : actions.visitGrandSiblings)
      patterns.push_back(substituteCaptures(visit, captures));

    // Walk from the file's directory up to and including the base directory.
    for (llvm::StringRef current = dir;; current = parentDirectory(current)) {
      for (const auto &pattern : patterns)
        if (auto err = expandInto(current, pattern, relations))
          return llvm::createStringError(
              std::errc::io_error,
              "error while visiting grand sibling '%s' at '%s': %s",
              pattern.c_str(), current.str().c_str(),
              llvm::toString(std::move(err)).c_str());
      if (current == ".")
        break;
    }
  }

  if (!actions.needsPythonImports())
    return llvm::Error::success();

  if (auto err = readText(state))
    return llvm::createStringError(std::errc::io_error,
                                   "error while reading python file: %s",
                                   llvm::toString(std::move(err)).c_str());
  if (!state.imports)
    state.imports = parsePythonImports(*state.text);
  const PythonImports &imports = *state.imports;

  for (const auto &target : actions.visitPythonAllSubmodulesFor) {
    std::string name = substituteCaptures(target, captures);
    std::string module;
    if (config.isInRootPythonPackage(name)) {
      module = name;
    } else {
      auto it = imports.boundNames.find(name);
      if (it == imports.boundNames.end())
        return llvm::createStringError(std::errc::invalid_argument,
                                       "module ident '%s' not found",
                                       name.c_str());
      module = it->second;
    }

    logVerbose("Visiting all submodules of: " + name + " -> " + module);
    std::string dirPath = module;
    std::replace(dirPath.begin(), dirPath.end(), '.', '/');
    if (auto err = expandInto(".", dirPath + "/**/*.py", relations))
      return llvm::createStringError(
          std::errc::io_error, "error while visiting submodule '%s': %s",
          module.c_str(), llvm::toString(std::move(err)).c_str());
  }

  for (const auto &module : imports.modules) {
    auto pathsOrErr = resolver.resolve(module);
    if (!pathsOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument,
          "error while resolving python module '%s': %s", module.c_str(),
          llvm::toString(pathsOrErr.takeError()).c_str());
    relations.insert(relations.end(), pathsOrErr->begin(), pathsOrErr->end());
  }

  return llvm::Error::success();
}

llvm::Error RelationEngine::applyRegexRules(const PathRule &rule,
                                            VisitState &state) {
  for (const auto &regexRule : rule.regexRules) {
    auto excluded = matchesAny(regexRule.actions.exclude, state.file);
    if (!excluded)
      return llvm::createStringError(
          std::errc::invalid_argument,
          "error checking exclude of '%s' in rule '%s': %s",
          regexRule.pattern.c_str(), rule.pattern.c_str(),
          llvm::toString(excluded.takeError()).c_str());
    if (*excluded)
      continue;

    if (auto err = readText(state))
      return llvm::createStringError(
          std::errc::io_error, "error while running path_rule '%s': %s",
          rule.pattern.c_str(), llvm::toString(std::move(err)).c_str());

    auto regexOrErr = getRegex(regexRule.pattern);
    if (!regexOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument,
          "error while running path_rule '%s': error while compiling regex "
          "rule '%s': %s",
          rule.pattern.c_str(), regexRule.pattern.c_str(),
          llvm::toString(regexOrErr.takeError()).c_str());

    // Matches are collected up front; applying actions may parse imports
    // from the same text.
    const std::string &text = *state.text;
    std::vector<std::vector<std::string>> matches;
    for (std::sregex_iterator it(text.begin(), text.end(), **regexOrErr), end;
         it != end; ++it) {
      std::vector<std::string> captures;
      for (const auto &group : *it)
        captures.push_back(group.matched ? group.str() : std::string());
      matches.push_back(std::move(captures));
    }

    for (const auto &captures : matches) {
      if (Logger::get().isVerbose())
        logVerbose("Matched regex rule: " + state.file + " " +
                   regexRule.pattern + " [" + llvm::join(captures, " ") +
                   "]");
      if (auto err = applyActions(regexRule.actions, state, captures))
        return llvm::createStringError(
            std::errc::invalid_argument,
            "error while running path_rule '%s': error while running regex "
            "rule '%s': %s",
            rule.pattern.c_str(), regexRule.pattern.c_str(),
            llvm::toString(std::move(err)).c_str());
    }
  }
  return llvm::Error::success();
}

llvm::Expected<std::vector<std::string>>
RelationEngine::visitFile(llvm::StringRef file) {
  auto excluded = matchesAny(config.getGlobalExclude(), file);
  if (!excluded)
    return llvm::createStringError(
        std::errc::invalid_argument, "error checking global_exclude: %s",
        llvm::toString(excluded.takeError()).c_str());
  if (*excluded) {
    LLVM_DEBUG(llvm::dbgs() << "Globally excluded: " << file << "\n");
    return std::vector<std::string>();
  }

  logVerbose("Visiting: " + file);

  VisitState state(file);
  for (const auto &rule : config.getPathRules()) {
    auto globOrErr = getGlob(rule.pattern);
    if (!globOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument, "error matching rule '%s': %s",
          rule.pattern.c_str(), llvm::toString(globOrErr.takeError()).c_str());
    if (!(*globOrErr)->match(file))
      continue;

    logVerbose("Matched rule: " + rule.pattern);
    if (auto err = applyActions(rule.actions, state, {}))
      return llvm::createStringError(
          std::errc::invalid_argument, "error while running path_rule '%s': %s",
          rule.pattern.c_str(), llvm::toString(std::move(err)).c_str());

    if (auto err = applyRegexRules(rule, state))
      return std::move(err);
  }

  return std::move(state.relations);
}
