//===- PythonModuleResolver.h - Python import resolution --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Maps dotted Python module names onto the files under the base directory that
// implement them. For `a.b.c` the resolver probes, relative to the base
// directory:
//
//   a/b/c/__init__.py   regular package
//   a/b/c/              namespace package (contributes no file)
//   a/b/c.py            module
//   a/b/c.pyx           Cython module
//   a/b/c.pyi           type stub
//
// Every form that exists contributes. If any of them exists, the resolution of
// the parent package `a.b` is appended as well, since importing a module
// executes its parents' `__init__.py`.
//
// Only modules inside the configured root packages are resolved; everything
// else is a third-party or standard library import and resolves to nothing.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_ANALYSIS_PYTHONMODULERESOLVER_H
#define DAGGER_ANALYSIS_PYTHONMODULERESOLVER_H

#include "dagger/Support/DaggerConfig.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace dagger {

class PythonModuleResolver {
public:
  PythonModuleResolver(const DaggerConfig &config, llvm::StringRef baseDir);

  /// Resolve `module` to the files implementing it, as paths relative to the
  /// base directory. Results are memoized, including empty ones, and the
  /// returned list stays valid for the lifetime of the resolver. Relative
  /// module names are rejected.
  ///
  /// Not thread safe.
  llvm::Expected<llvm::ArrayRef<std::string>> resolve(llvm::StringRef module);

  /// True if `module` has already been resolved.
  bool isCached(llvm::StringRef module) const { return cache.count(module); }

  size_t getNumCached() const { return cache.size(); }

private:
  std::string getFullPath(llvm::StringRef relPath) const;

  const DaggerConfig &config;
  std::string baseDir;
  llvm::StringMap<std::vector<std::string>> cache;
};

} // namespace dagger

#endif // DAGGER_ANALYSIS_PYTHONMODULERESOLVER_H
