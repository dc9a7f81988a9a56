//===- PythonModuleResolver.cpp - Python import resolution ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/PythonModuleResolver.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>

#define DEBUG_TYPE "dagger-python-resolver"

using namespace dagger;

PythonModuleResolver::PythonModuleResolver(const DaggerConfig &config,
                                           llvm::StringRef baseDir)
    : config(config), baseDir(baseDir.str()) {}

std::string PythonModuleResolver::getFullPath(llvm::StringRef relPath) const {
  llvm::SmallString<256> path(baseDir);
  llvm::sys::path::append(path, relPath);
  return path.str().str();
}

llvm::Expected<llvm::ArrayRef<std::string>>
PythonModuleResolver::resolve(llvm::StringRef module) {
  auto it = cache.find(module);
  if (it != cache.end())
    return llvm::ArrayRef<std::string>(it->second);

  if (module.empty() || module.front() == '.')
    return llvm::createStringError(std::errc::not_supported,
                                   "relative imports are not supported: '%s'",
                                   module.str().c_str());

  if (!config.isInRootPythonPackage(module)) {
    LLVM_DEBUG(llvm::dbgs() << "Skipping module outside root packages: "
                            << module << "\n");
    return llvm::ArrayRef<std::string>(cache[module]);
  }

  std::string dirPath = module.str();
  std::replace(dirPath.begin(), dirPath.end(), '.', '/');

  std::vector<std::string> paths;
  bool found = false;

  std::string initPath = dirPath + "/__init__.py";
  if (llvm::sys::fs::exists(getFullPath(initPath))) {
    paths.push_back(initPath);
    found = true;
  }
  // A bare directory is a namespace package; there is no file to record.
  if (llvm::sys::fs::is_directory(getFullPath(dirPath)))
    found = true;
  for (llvm::StringRef ext : {".py", ".pyx", ".pyi"}) {
    std::string filePath = dirPath + ext.str();
    if (llvm::sys::fs::exists(getFullPath(filePath))) {
      paths.push_back(filePath);
      found = true;
    }
  }

  if (found) {
    size_t dot = module.rfind('.');
    if (dot != llvm::StringRef::npos) {
      auto parentOrErr = resolve(module.substr(0, dot));
      if (!parentOrErr)
        return parentOrErr.takeError();
      paths.insert(paths.end(), parentOrErr->begin(), parentOrErr->end());
    }
  }

  LLVM_DEBUG(llvm::dbgs() << "Resolved " << module << " to " << paths.size()
                          << " files\n");
  auto &entry = cache[module];
  entry = std::move(paths);
  return llvm::ArrayRef<std::string>(entry);
}
