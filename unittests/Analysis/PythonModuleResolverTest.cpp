//===- PythonModuleResolverTest.cpp - Unit tests for module lookup --------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/PythonModuleResolver.h"
#include "TestTree.h"
#include "gtest/gtest.h"

using namespace dagger;

namespace {

using Paths = std::vector<std::string>;

class PythonModuleResolverTest : public TestTree {
protected:
  void SetUp() override {
    TestTree::SetUp();
    auto result = DaggerConfig::loadFromYAML("root_python_packages: [pkg]\n");
    ASSERT_TRUE(static_cast<bool>(result))
        << llvm::toString(result.takeError());
    config = std::move(*result);
  }

  Paths resolve(PythonModuleResolver &resolver, llvm::StringRef module) {
    auto result = resolver.resolve(module);
    if (!result) {
      ADD_FAILURE() << llvm::toString(result.takeError());
      return {};
    }
    return Paths(result->begin(), result->end());
  }

  std::unique_ptr<DaggerConfig> config;
};

TEST_F(PythonModuleResolverTest, ModuleAndEnclosingPackages) {
  writeFile("pkg/__init__.py");
  writeFile("pkg/sub/__init__.py");
  writeFile("pkg/sub/mod.py");

  PythonModuleResolver resolver(*config, tempDir);
  EXPECT_EQ(resolve(resolver, "pkg.sub.mod"),
            (Paths{"pkg/sub/mod.py", "pkg/sub/__init__.py",
                   "pkg/__init__.py"}));

  // Enclosing packages were resolved on the way up.
  EXPECT_TRUE(resolver.isCached("pkg.sub"));
  EXPECT_TRUE(resolver.isCached("pkg"));
  EXPECT_EQ(resolve(resolver, "pkg.sub"),
            (Paths{"pkg/sub/__init__.py", "pkg/__init__.py"}));
}

TEST_F(PythonModuleResolverTest, ModulesOutsideRootPackagesAreSkipped) {
  writeFile("os/path.py");

  PythonModuleResolver resolver(*config, tempDir);
  EXPECT_TRUE(resolve(resolver, "os.path").empty());
  EXPECT_TRUE(resolve(resolver, "pkgx").empty());
  EXPECT_TRUE(resolver.isCached("os.path"));
  EXPECT_EQ(resolver.getNumCached(), 2u);
}

TEST_F(PythonModuleResolverTest, RelativeImportsAreRejected) {
  PythonModuleResolver resolver(*config, tempDir);

  auto result = resolver.resolve(".sibling");
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_NE(llvm::toString(result.takeError())
                .find("relative imports are not supported"),
            std::string::npos);

  auto empty = resolver.resolve("");
  ASSERT_FALSE(static_cast<bool>(empty));
  llvm::consumeError(empty.takeError());
}

TEST_F(PythonModuleResolverTest, NamespacePackages) {
  // No __init__.py anywhere: the directories still count as packages.
  writeFile("pkg/ns/leaf.py");

  PythonModuleResolver resolver(*config, tempDir);
  EXPECT_EQ(resolve(resolver, "pkg.ns.leaf"), (Paths{"pkg/ns/leaf.py"}));
  EXPECT_TRUE(resolve(resolver, "pkg.ns").empty());
  EXPECT_TRUE(resolver.isCached("pkg"));
}

TEST_F(PythonModuleResolverTest, AllExtensionsAreCollected) {
  writeFile("pkg/__init__.py");
  writeFile("pkg/fast.py");
  writeFile("pkg/fast.pyx");
  writeFile("pkg/fast.pyi");
  writeFile("pkg/fast.c");

  PythonModuleResolver resolver(*config, tempDir);
  EXPECT_EQ(resolve(resolver, "pkg.fast"),
            (Paths{"pkg/fast.py", "pkg/fast.pyx", "pkg/fast.pyi",
                   "pkg/__init__.py"}));
}

TEST_F(PythonModuleResolverTest, MissingModuleDoesNotPullInParents) {
  writeFile("pkg/__init__.py");

  PythonModuleResolver resolver(*config, tempDir);
  // `from pkg import name` produces `pkg.name` even when `name` is an
  // attribute rather than a module.
  EXPECT_TRUE(resolve(resolver, "pkg.some_function").empty());
  EXPECT_FALSE(resolver.isCached("pkg"));
  EXPECT_EQ(resolve(resolver, "pkg"), (Paths{"pkg/__init__.py"}));
}

} // namespace
