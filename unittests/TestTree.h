//===- TestTree.h - Temporary source trees for unit tests -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_UNITTESTS_TESTTREE_H
#define DAGGER_UNITTESTS_TESTTREE_H

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

#include <string>

namespace dagger {

/// Fixture owning a fresh temporary directory that tests populate with files.
class TestTree : public ::testing::Test {
protected:
  void SetUp() override {
    llvm::SmallString<128> tempPath;
    std::error_code ec =
        llvm::sys::fs::createUniqueDirectory("repo-dagger-test", tempPath);
    ASSERT_FALSE(ec) << "Failed to create temp directory";
    tempDir = tempPath.str().str();
  }

  void TearDown() override {
    if (!tempDir.empty())
      llvm::sys::fs::remove_directories(tempDir);
  }

  /// Absolute path of `relPath` inside the tree.
  std::string path(llvm::StringRef relPath) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, relPath);
    return result.str().str();
  }

  void makeDir(llvm::StringRef relPath) {
    std::error_code ec = llvm::sys::fs::create_directories(path(relPath));
    ASSERT_FALSE(ec) << "Failed to create " << relPath.str();
  }

  /// Write `content` to `relPath`, creating parent directories.
  void writeFile(llvm::StringRef relPath, llvm::StringRef content = "") {
    std::string fullPath = path(relPath);
    std::error_code ec = llvm::sys::fs::create_directories(
        llvm::sys::path::parent_path(fullPath));
    ASSERT_FALSE(ec) << "Failed to create parent of " << relPath.str();

    llvm::raw_fd_ostream os(fullPath, ec);
    ASSERT_FALSE(ec) << "Failed to open " << relPath.str();
    os << content;
  }

  std::string tempDir;
};

} // namespace dagger

#endif // DAGGER_UNITTESTS_TESTTREE_H
