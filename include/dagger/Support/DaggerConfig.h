//===- DaggerConfig.h - Relation rule configuration -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the DaggerConfig class, the decoded form of a
// repo-dagger YAML configuration file.
//
// Example configuration:
//
// ```yaml
// base_dir: "."
// inputs: "tests/**/test_*.py"
// global_deps:
//   - "poetry.lock"
// global_exclude:
//   - "**/*.pyc"
// root_python_packages:
//   - "frobnicator"
//   - "tests"
//
// path_rules:
//   "tests/**/test_*.py":
//     visit_grand_siblings:
//       - "conftest.py"
//       - "__init__.py"
//   "**/*.py":
//     visit_imported_python_modules: true
//     regex_rules:
//       "(?m:^ *import_all_submodules\\(([A-Za-z_][A-Za-z0-9_.]*)\\))":
//         visit_python_all_submodules_for: "$1"
// ```
//
// Every list-valued field also accepts a single string. Unknown keys are
// rejected at every level.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_SUPPORT_DAGGERCONFIG_H
#define DAGGER_SUPPORT_DAGGERCONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dagger {

/// SHA-256 of the raw configuration bytes.
using ConfigHash = std::array<uint8_t, 32>;

//===----------------------------------------------------------------------===//
// Rules
//===----------------------------------------------------------------------===//

/// The actions run when a path rule or regex rule fires. String fields may
/// reference regex capture groups as `$0`, `$1`, ...
struct RuleActions {
  /// Glob patterns relative to the base directory.
  std::vector<std::string> visit;

  /// Glob patterns relative to the visited file's directory.
  std::vector<std::string> visitSiblings;

  /// Glob patterns relative to the visited file's directory and each of its
  /// ancestors up to the base directory.
  std::vector<std::string> visitGrandSiblings;

  /// Resolve the file's Python imports.
  bool visitImportedPythonModules = false;

  /// Python modules whose whole subtree of `.py` files is visited.
  std::vector<std::string> visitPythonAllSubmodulesFor;

  /// Files for which a regex rule's actions are suppressed. Ignored on path
  /// rules.
  std::vector<std::string> exclude;

  /// True if running these actions requires parsing Python imports.
  bool needsPythonImports() const {
    return visitImportedPythonModules || !visitPythonAllSubmodulesFor.empty();
  }
};

/// Actions applied once per match of `pattern` in the visited file's text.
struct RegexRule {
  std::string pattern;
  RuleActions actions;
};

/// Actions applied to every file matching the glob `pattern`.
struct PathRule {
  std::string pattern;
  RuleActions actions;
  /// Regex rules in configuration order.
  std::vector<RegexRule> regexRules;
};

//===----------------------------------------------------------------------===//
// DaggerConfig
//===----------------------------------------------------------------------===//

class DaggerConfig {
public:
  DaggerConfig();
  ~DaggerConfig();

  //===--------------------------------------------------------------------===//
  // Loading Methods
  //===--------------------------------------------------------------------===//

  /// Load configuration from a YAML file. The root directory is set to the
  /// directory containing the file.
  static llvm::Expected<std::unique_ptr<DaggerConfig>>
  loadFromFile(llvm::StringRef filePath);

  /// Load configuration from a YAML string.
  static llvm::Expected<std::unique_ptr<DaggerConfig>>
  loadFromYAML(llvm::StringRef yamlContent);

  //===--------------------------------------------------------------------===//
  // Accessors
  //===--------------------------------------------------------------------===//

  /// The `base_dir` field as written.
  llvm::StringRef getBaseDir() const { return baseDir; }

  const std::vector<std::string> &getInputs() const { return inputs; }

  /// Replace the configured input patterns.
  void setInputs(std::vector<std::string> patterns) {
    inputs = std::move(patterns);
  }

  const std::vector<std::string> &getGlobalDeps() const { return globalDeps; }

  const std::vector<std::string> &getGlobalExclude() const {
    return globalExclude;
  }

  const std::vector<std::string> &getRootPythonPackages() const {
    return rootPythonPackages;
  }

  /// Path rules in configuration order.
  const std::vector<PathRule> &getPathRules() const { return pathRules; }

  /// Hash of the configuration bytes this object was decoded from.
  const ConfigHash &getConfigHash() const { return configHash; }

  /// Directory the configuration was loaded from.
  llvm::StringRef getRootDirectory() const { return rootDirectory; }

  void setRootDirectory(llvm::StringRef dir) { rootDirectory = dir.str(); }

  //===--------------------------------------------------------------------===//
  // Resolution Methods
  //===--------------------------------------------------------------------===//

  /// Return the directory all relative paths are resolved against: `base_dir`
  /// joined to the root directory, or `base_dir` itself if absolute.
  std::string getResolvedBaseDir() const;

  /// True if `module` is one of the root Python packages or a dotted
  /// descendant of one.
  bool isInRootPythonPackage(llvm::StringRef module) const;

  /// Expand the input patterns under the resolved base directory. The result
  /// is sorted and free of duplicates.
  llvm::Expected<std::vector<std::string>> resolveInputFiles() const;

  /// Render the decoded configuration as YAML.
  std::string toYAML() const;

private:
  std::string baseDir;
  std::vector<std::string> inputs;
  std::vector<std::string> globalDeps;
  std::vector<std::string> globalExclude;
  std::vector<std::string> rootPythonPackages;
  std::vector<PathRule> pathRules;

  ConfigHash configHash = {};
  std::string rootDirectory;
};

} // namespace dagger

#endif // DAGGER_SUPPORT_DAGGERCONFIG_H
