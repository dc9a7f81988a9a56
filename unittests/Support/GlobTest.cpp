//===- GlobTest.cpp - Unit tests for path globs ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/Glob.h"
#include "TestTree.h"
#include "gtest/gtest.h"

using namespace dagger;

namespace {

/// Match `path` against `pattern`, failing the test on a bad pattern.
bool matches(llvm::StringRef pattern, llvm::StringRef path) {
  auto result = matchGlob(pattern, path);
  if (!result) {
    ADD_FAILURE() << "bad pattern '" << pattern.str()
                  << "': " << llvm::toString(result.takeError());
    return false;
  }
  return *result;
}

using Paths = std::vector<std::string>;

//===----------------------------------------------------------------------===//
// Matching Tests
//===----------------------------------------------------------------------===//

TEST(GlobTest, SingleSegmentWildcards) {
  EXPECT_TRUE(matches("*.py", "setup.py"));
  EXPECT_FALSE(matches("*.py", "pkg/setup.py"));
  EXPECT_TRUE(matches("test_?.py", "test_a.py"));
  EXPECT_FALSE(matches("test_?.py", "test_ab.py"));
  EXPECT_TRUE(matches("[abc].txt", "b.txt"));
  EXPECT_FALSE(matches("[abc].txt", "d.txt"));
  EXPECT_TRUE(matches("[!abc].txt", "d.txt"));
}

TEST(GlobTest, RecursiveSegments) {
  EXPECT_TRUE(matches("**/*.py", "a.py"));
  EXPECT_TRUE(matches("**/*.py", "x/y/z/a.py"));
  EXPECT_FALSE(matches("**/*.py", "x/y/a.pyc"));

  EXPECT_TRUE(matches("tests/**/test_*.py", "tests/test_foo.py"));
  EXPECT_TRUE(matches("tests/**/test_*.py", "tests/unit/deep/test_bar.py"));
  EXPECT_FALSE(matches("tests/**/test_*.py", "tests/unit/helper.py"));
  EXPECT_FALSE(matches("tests/**/test_*.py", "src/tests/test_foo.py"));

  EXPECT_TRUE(matches("pkg/**", "pkg/a/b"));
  EXPECT_TRUE(matches("a/**/b/**/c", "a/b/c"));
  EXPECT_TRUE(matches("a/**/b/**/c", "a/x/b/y/z/c"));
}

TEST(GlobTest, LiteralPaths) {
  EXPECT_TRUE(matches("frobnicator/database/__init__.py",
                      "frobnicator/database/__init__.py"));
  EXPECT_FALSE(matches("frobnicator/database/__init__.py",
                       "frobnicator/database/models.py"));
  EXPECT_TRUE(matches("./setup.py", "setup.py"));

  auto glob = PathGlob::create("a/b.txt");
  ASSERT_TRUE(static_cast<bool>(glob)) << llvm::toString(glob.takeError());
  EXPECT_TRUE(glob->isLiteral());

  auto wild = PathGlob::create("a/*.txt");
  ASSERT_TRUE(static_cast<bool>(wild)) << llvm::toString(wild.takeError());
  EXPECT_FALSE(wild->isLiteral());
}

TEST(GlobTest, BraceAlternatives) {
  EXPECT_TRUE(matches("*.{py,pyi}", "mod.pyi"));
  EXPECT_TRUE(matches("*.{py,pyi}", "mod.py"));
  EXPECT_FALSE(matches("*.{py,pyi}", "mod.pyx"));
  EXPECT_TRUE(matches("{src,lib}/**/*.h", "lib/x/y.h"));

  auto expanded = expandBraces("a{b,c{d,e}}f");
  ASSERT_TRUE(static_cast<bool>(expanded))
      << llvm::toString(expanded.takeError());
  EXPECT_EQ(*expanded, (Paths{"abf", "acdf", "acef"}));

  auto plain = expandBraces("no/braces/*.py");
  ASSERT_TRUE(static_cast<bool>(plain)) << llvm::toString(plain.takeError());
  EXPECT_EQ(*plain, (Paths{"no/braces/*.py"}));
}

TEST(GlobTest, RejectsInvalidPatterns) {
  auto unterminated = PathGlob::create("*.{py,pyi");
  ASSERT_FALSE(static_cast<bool>(unterminated));
  EXPECT_NE(llvm::toString(unterminated.takeError()).find("unterminated"),
            std::string::npos);

  auto parent = PathGlob::create("../secrets/*.txt");
  ASSERT_FALSE(static_cast<bool>(parent));
  EXPECT_NE(llvm::toString(parent.takeError()).find(".."), std::string::npos);

  auto absolute = PathGlob::create("/etc/passwd");
  ASSERT_FALSE(static_cast<bool>(absolute));
  EXPECT_NE(llvm::toString(absolute.takeError()).find("relative"),
            std::string::npos);

  auto bracket = PathGlob::create("src/[abc");
  ASSERT_FALSE(static_cast<bool>(bracket));
  llvm::consumeError(bracket.takeError());
}

TEST(GlobTest, PathHelpers) {
  EXPECT_EQ(joinRelative(".", "a.py"), "a.py");
  EXPECT_EQ(joinRelative("", "a.py"), "a.py");
  EXPECT_EQ(joinRelative("pkg/sub", "a.py"), "pkg/sub/a.py");

  EXPECT_EQ(parentDirectory("a.py"), ".");
  EXPECT_EQ(parentDirectory("pkg/a.py"), "pkg");
  EXPECT_EQ(parentDirectory("pkg/sub/a.py"), "pkg/sub");
  EXPECT_EQ(parentDirectory("pkg"), ".");
}

//===----------------------------------------------------------------------===//
// Expansion Tests
//===----------------------------------------------------------------------===//

class GlobExpandTest : public TestTree {
protected:
  void SetUp() override {
    TestTree::SetUp();
    writeFile("a.py");
    writeFile("pkg/b.py");
    writeFile("pkg/sub/c.py");
    writeFile("pkg/sub/d.txt");
    makeDir("pkg/empty");
  }

  Paths expand(llvm::StringRef pattern, bool filesOnly = true) {
    auto result = expandGlob(tempDir, pattern, filesOnly);
    if (!result) {
      ADD_FAILURE() << llvm::toString(result.takeError());
      return {};
    }
    return *result;
  }
};

TEST_F(GlobExpandTest, RecursiveExpansionIsSorted) {
  EXPECT_EQ(expand("**/*.py"), (Paths{"a.py", "pkg/b.py", "pkg/sub/c.py"}));
  EXPECT_EQ(expand("pkg/**"), (Paths{"pkg/b.py", "pkg/sub/c.py",
                                     "pkg/sub/d.txt"}));
}

TEST_F(GlobExpandTest, FilesOnlyDropsDirectories) {
  EXPECT_EQ(expand("pkg/*"), (Paths{"pkg/b.py"}));
  EXPECT_EQ(expand("pkg/*", /*filesOnly=*/false),
            (Paths{"pkg/b.py", "pkg/empty", "pkg/sub"}));
}

TEST_F(GlobExpandTest, LiteralAndMissingPaths) {
  EXPECT_EQ(expand("pkg/sub/d.txt"), (Paths{"pkg/sub/d.txt"}));
  EXPECT_TRUE(expand("pkg/sub/missing.txt").empty());
  EXPECT_TRUE(expand("nowhere/**/*.py").empty());
  EXPECT_TRUE(expand("a.py/*.py").empty());
}

TEST_F(GlobExpandTest, OverlappingAlternativesAreUnique) {
  EXPECT_EQ(expand("{pkg/**/*.py,pkg/sub/*.py}"),
            (Paths{"pkg/b.py", "pkg/sub/c.py"}));
}

TEST_F(GlobExpandTest, RecursiveSegmentSkipsSymlinkedDirectories) {
  writeFile("real/x.py");
  std::error_code ec = llvm::sys::fs::create_link(path("real"), path("alias"));
  ASSERT_FALSE(ec) << ec.message();

  EXPECT_EQ(expand("**/x.py"), (Paths{"real/x.py"}));
  EXPECT_EQ(expand("alias/*.py"), (Paths{"alias/x.py"}));
}

TEST_F(GlobExpandTest, RootMayBeASubdirectory) {
  auto result = expandGlob(path("pkg"), "*.py");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(*result, (Paths{"b.py"}));
}

} // namespace
