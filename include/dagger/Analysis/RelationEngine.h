//===- RelationEngine.h - Rule-driven file relations ------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The relation engine computes the files a single file directly relates to by
// running every path rule that matches it. Path rules match on the file's
// path; their regex rules match on its text, and run once per match with the
// match's capture groups available as `$0`, `$1`, ... in the action strings.
//
// Regular expressions use the ECMAScript grammar of std::regex and are always
// compiled in multiline mode, so `^` and `$` anchor at line boundaries. The
// inline `(?m:...)` group and a leading `(?m)` are accepted for compatibility.
//
// `visit_grand_siblings` patterns are globbed in the file's directory and in
// every ancestor up to and including the base directory itself. Earlier
// releases stopped one level below the base directory, so a `conftest.py` at
// the root was not picked up.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_ANALYSIS_RELATIONENGINE_H
#define DAGGER_ANALYSIS_RELATIONENGINE_H

#include "dagger/Analysis/PythonModuleResolver.h"
#include "dagger/Support/DaggerConfig.h"
#include "dagger/Support/Glob.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <regex>
#include <string>
#include <vector>

namespace dagger {

//===----------------------------------------------------------------------===//
// Python Imports
//===----------------------------------------------------------------------===//

/// The import statements of a Python source file.
struct PythonImports {
  /// Every fully-qualified module name imported, in order of appearance. For
  /// `from a import b` both `a` and `a.b` are listed.
  std::vector<std::string> modules;

  /// Maps each name bound by an import to the module it denotes: `a.b` for
  /// `import a.b`, and `a.b` under `b` for `from a import b`.
  llvm::StringMap<std::string> boundNames;
};

/// Extract the imports of a Python source file. Detection is line and pattern
/// based: imports inside strings are found, dynamic imports are not.
PythonImports parsePythonImports(llvm::StringRef text);

//===----------------------------------------------------------------------===//
// Capture Substitution
//===----------------------------------------------------------------------===//

/// Replace every `$N` in `text` with `captures[N]`. The longest run of digits
/// naming an existing capture is used; `$` followed by anything else is kept.
/// Substituted text is not rescanned.
std::string substituteCaptures(llvm::StringRef text,
                               llvm::ArrayRef<std::string> captures);

/// Translate the RE2-style inline multiline flag into ECMAScript syntax.
std::string translateRegexSyntax(llvm::StringRef pattern);

//===----------------------------------------------------------------------===//
// RelationEngine
//===----------------------------------------------------------------------===//

class RelationEngine {
public:
  RelationEngine(const DaggerConfig &config, llvm::StringRef baseDir,
                 PythonModuleResolver &resolver);

  /// Return the files `file` directly relates to, unsorted and possibly with
  /// duplicates. Globally excluded files relate to nothing.
  ///
  /// Not thread safe: compiled patterns and module resolutions are cached.
  llvm::Expected<std::vector<std::string>> visitFile(llvm::StringRef file);

  /// Number of distinct regular expressions compiled so far.
  size_t getNumCompiledRegexes() const { return regexCache.size(); }

private:
  struct VisitState;

  llvm::Error applyActions(const RuleActions &actions, VisitState &state,
                           llvm::ArrayRef<std::string> captures);
  llvm::Error applyRegexRules(const PathRule &rule, VisitState &state);

  llvm::Error readText(VisitState &state);
  llvm::Error expandInto(llvm::StringRef dir, llvm::StringRef pattern,
                         std::vector<std::string> &out);

  llvm::Expected<const PathGlob *> getGlob(llvm::StringRef pattern);
  llvm::Expected<const std::regex *> getRegex(llvm::StringRef pattern);
  llvm::Expected<bool> matchesAny(llvm::ArrayRef<std::string> patterns,
                                  llvm::StringRef file);

  const DaggerConfig &config;
  std::string baseDir;
  PythonModuleResolver &resolver;

  llvm::StringMap<PathGlob> globCache;
  llvm::StringMap<std::regex> regexCache;
};

} // namespace dagger

#endif // DAGGER_ANALYSIS_RELATIONENGINE_H
