//===- DaggerConfigTest.cpp - Unit tests for DaggerConfig -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/DaggerConfig.h"
#include "TestTree.h"
#include "llvm/Support/SHA256.h"
#include "gtest/gtest.h"

using namespace dagger;

namespace {

using Strings = std::vector<std::string>;

/// Return the message of a failed load, or the empty string if it succeeded.
std::string loadError(llvm::StringRef yaml) {
  auto result = DaggerConfig::loadFromYAML(yaml);
  if (result)
    return "";
  return llvm::toString(result.takeError());
}

//===----------------------------------------------------------------------===//
// Basic Parsing Tests
//===----------------------------------------------------------------------===//

TEST(DaggerConfigTest, EmptyConfig) {
  auto result = DaggerConfig::loadFromYAML("");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto &config = *result;
  EXPECT_TRUE(config->getBaseDir().empty());
  EXPECT_TRUE(config->getInputs().empty());
  EXPECT_TRUE(config->getGlobalDeps().empty());
  EXPECT_TRUE(config->getGlobalExclude().empty());
  EXPECT_TRUE(config->getRootPythonPackages().empty());
  EXPECT_TRUE(config->getPathRules().empty());
}

TEST(DaggerConfigTest, CommentOnlyConfig) {
  auto result = DaggerConfig::loadFromYAML("# nothing configured yet\n");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_TRUE((*result)->getPathRules().empty());
}

TEST(DaggerConfigTest, FullConfig) {
  const char *yaml = R"yaml(
base_dir: ..
inputs:
  - "tests/**/test_*.py"
  - "tools/*.py"
global_deps: poetry.lock
global_exclude:
  - "**/generated/**"
root_python_packages: [frobnicator, tools]
path_rules:
  "**/*.py":
    visit_imported_python_modules: true
    visit_grand_siblings: conftest.py
  "tests/**/test_*.py":
    visit_siblings: [fixtures.json]
    regex_rules:
      "^# uses: (\\S+)$":
        visit: "data/$1"
        exclude: "tests/legacy/**"
      "import_all_submodules\\((\\S+)\\)":
        visit_python_all_submodules_for: $1
  "frobnicator/database/__init__.py":
    visit: "frobnicator/database/**/*.sql"
)yaml";

  auto result = DaggerConfig::loadFromYAML(yaml);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto &config = *result;
  EXPECT_EQ(config->getBaseDir(), "..");
  EXPECT_EQ(config->getInputs(), (Strings{"tests/**/test_*.py", "tools/*.py"}));
  EXPECT_EQ(config->getGlobalDeps(), (Strings{"poetry.lock"}));
  EXPECT_EQ(config->getGlobalExclude(), (Strings{"**/generated/**"}));
  EXPECT_EQ(config->getRootPythonPackages(),
            (Strings{"frobnicator", "tools"}));

  // Rules keep their configuration order.
  const auto &rules = config->getPathRules();
  ASSERT_EQ(rules.size(), 3u);
  EXPECT_EQ(rules[0].pattern, "**/*.py");
  EXPECT_EQ(rules[1].pattern, "tests/**/test_*.py");
  EXPECT_EQ(rules[2].pattern, "frobnicator/database/__init__.py");

  EXPECT_TRUE(rules[0].actions.visitImportedPythonModules);
  EXPECT_EQ(rules[0].actions.visitGrandSiblings, (Strings{"conftest.py"}));
  EXPECT_TRUE(rules[0].actions.needsPythonImports());
  EXPECT_TRUE(rules[0].regexRules.empty());

  EXPECT_EQ(rules[1].actions.visitSiblings, (Strings{"fixtures.json"}));
  EXPECT_FALSE(rules[1].actions.needsPythonImports());
  ASSERT_EQ(rules[1].regexRules.size(), 2u);
  EXPECT_EQ(rules[1].regexRules[0].pattern, "^# uses: (\\S+)$");
  EXPECT_EQ(rules[1].regexRules[0].actions.visit, (Strings{"data/$1"}));
  EXPECT_EQ(rules[1].regexRules[0].actions.exclude,
            (Strings{"tests/legacy/**"}));
  EXPECT_EQ(rules[1].regexRules[1].pattern,
            "import_all_submodules\\((\\S+)\\)");
  EXPECT_EQ(rules[1].regexRules[1].actions.visitPythonAllSubmodulesFor,
            (Strings{"$1"}));
  EXPECT_TRUE(rules[1].regexRules[1].actions.needsPythonImports());

  EXPECT_EQ(rules[2].actions.visit, (Strings{"frobnicator/database/**/*.sql"}));
}

TEST(DaggerConfigTest, BooleanSpellings) {
  for (const char *value : {"true", "True", "TRUE", "yes", "on"}) {
    std::string yaml = std::string("path_rules:\n  \"*.py\":\n"
                                   "    visit_imported_python_modules: ") +
                       value + "\n";
    auto result = DaggerConfig::loadFromYAML(yaml);
    ASSERT_TRUE(static_cast<bool>(result))
        << value << ": " << llvm::toString(result.takeError());
    EXPECT_TRUE((*result)->getPathRules()[0].actions.visitImportedPythonModules)
        << value;
  }
  for (const char *value : {"false", "False", "no", "off"}) {
    std::string yaml = std::string("path_rules:\n  \"*.py\":\n"
                                   "    visit_imported_python_modules: ") +
                       value + "\n";
    auto result = DaggerConfig::loadFromYAML(yaml);
    ASSERT_TRUE(static_cast<bool>(result))
        << value << ": " << llvm::toString(result.takeError());
    EXPECT_FALSE(
        (*result)->getPathRules()[0].actions.visitImportedPythonModules)
        << value;
  }

  EXPECT_NE(loadError("path_rules:\n  \"*.py\":\n"
                      "    visit_imported_python_modules: maybe\n")
                .find("expected a boolean"),
            std::string::npos);
}

TEST(DaggerConfigTest, NullValuesAreEmpty) {
  const char *yaml = R"yaml(
base_dir: ~
inputs:
global_deps: null
path_rules:
  "*.py":
)yaml";

  auto result = DaggerConfig::loadFromYAML(yaml);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto &config = *result;
  EXPECT_TRUE(config->getBaseDir().empty());
  EXPECT_TRUE(config->getInputs().empty());
  EXPECT_TRUE(config->getGlobalDeps().empty());
  ASSERT_EQ(config->getPathRules().size(), 1u);
  EXPECT_TRUE(config->getPathRules()[0].actions.visit.empty());
}

TEST(DaggerConfigTest, PathRuleExcludeIsAccepted) {
  auto result = DaggerConfig::loadFromYAML(
      "path_rules:\n  \"*.py\":\n    exclude: setup.py\n");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ((*result)->getPathRules()[0].actions.exclude,
            (Strings{"setup.py"}));
}

//===----------------------------------------------------------------------===//
// Error Tests
//===----------------------------------------------------------------------===//

TEST(DaggerConfigTest, UnknownTopLevelField) {
  std::string error = loadError("base_dir: .\nouputs: [a]\n");
  EXPECT_NE(error.find("failed to decode config"), std::string::npos);
  EXPECT_NE(error.find("unknown field 'ouputs'"), std::string::npos);
}

TEST(DaggerConfigTest, UnknownRuleField) {
  std::string error =
      loadError("path_rules:\n  \"*.py\":\n    visit_sibling: a.py\n");
  EXPECT_NE(error.find("path rule '*.py'"), std::string::npos);
  EXPECT_NE(error.find("unknown field 'visit_sibling'"), std::string::npos);
}

TEST(DaggerConfigTest, RegexRulesOnlyOnPathRules) {
  std::string error = loadError(R"yaml(
path_rules:
  "*.py":
    regex_rules:
      "foo":
        regex_rules: {}
)yaml");
  EXPECT_NE(error.find("unknown field 'regex_rules'"), std::string::npos);
}

TEST(DaggerConfigTest, DuplicateKeys) {
  std::string error = loadError("inputs: a\ninputs: b\n");
  EXPECT_NE(error.find("duplicate key 'inputs'"), std::string::npos);

  std::string ruleError =
      loadError("path_rules:\n  \"*.py\": {}\n  \"*.py\": {}\n");
  EXPECT_NE(ruleError.find("duplicate key '*.py'"), std::string::npos);
}

TEST(DaggerConfigTest, MalformedYAML) {
  EXPECT_NE(loadError("inputs: [a, b\n").find("failed to decode config"),
            std::string::npos);
  EXPECT_NE(loadError("- just\n- a list\n").find("root must be a mapping"),
            std::string::npos);
}

TEST(DaggerConfigTest, WrongValueShapes) {
  EXPECT_NE(loadError("inputs:\n  a: b\n")
                .find("expected string or list of strings"),
            std::string::npos);
  EXPECT_NE(loadError("path_rules: [a]\n").find("expected a mapping"),
            std::string::npos);
  EXPECT_NE(loadError("base_dir: [a]\n").find("expected a string"),
            std::string::npos);
}

//===----------------------------------------------------------------------===//
// Derived Values
//===----------------------------------------------------------------------===//

TEST(DaggerConfigTest, ConfigHashCoversRawBytes) {
  llvm::StringRef yaml = "inputs: a.py\n";
  auto result = DaggerConfig::loadFromYAML(yaml);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ((*result)->getConfigHash(),
            llvm::SHA256::hash(llvm::arrayRefFromStringRef(yaml)));

  // Comments do not change the decoded config but do change the hash.
  auto commented = DaggerConfig::loadFromYAML("inputs: a.py # same\n");
  ASSERT_TRUE(static_cast<bool>(commented))
      << llvm::toString(commented.takeError());
  EXPECT_EQ((*commented)->getInputs(), (*result)->getInputs());
  EXPECT_NE((*commented)->getConfigHash(), (*result)->getConfigHash());
}

TEST(DaggerConfigTest, RootPythonPackageMembership) {
  auto result =
      DaggerConfig::loadFromYAML("root_python_packages: [pkg, tools.sub]\n");
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto &config = *result;
  EXPECT_TRUE(config->isInRootPythonPackage("pkg"));
  EXPECT_TRUE(config->isInRootPythonPackage("pkg.sub.mod"));
  EXPECT_TRUE(config->isInRootPythonPackage("tools.sub.x"));
  EXPECT_FALSE(config->isInRootPythonPackage("pkgx"));
  EXPECT_FALSE(config->isInRootPythonPackage("tools"));
  EXPECT_FALSE(config->isInRootPythonPackage("os.path"));
}

TEST(DaggerConfigTest, YAMLRendering) {
  const char *yaml = R"yaml(
inputs: "a.py"
path_rules:
  "**/*.py":
    visit_imported_python_modules: true
    regex_rules:
      "x(\\d+)":
        visit: "y$1"
)yaml";
  auto result = DaggerConfig::loadFromYAML(yaml);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto reloaded = DaggerConfig::loadFromYAML((*result)->toYAML());
  ASSERT_TRUE(static_cast<bool>(reloaded))
      << llvm::toString(reloaded.takeError());

  auto &config = *reloaded;
  EXPECT_EQ(config->getInputs(), (Strings{"a.py"}));
  ASSERT_EQ(config->getPathRules().size(), 1u);
  const auto &rule = config->getPathRules()[0];
  EXPECT_TRUE(rule.actions.visitImportedPythonModules);
  ASSERT_EQ(rule.regexRules.size(), 1u);
  EXPECT_EQ(rule.regexRules[0].pattern, "x(\\d+)");
  EXPECT_EQ(rule.regexRules[0].actions.visit, (Strings{"y$1"}));

  auto empty = DaggerConfig::loadFromYAML("");
  ASSERT_TRUE(static_cast<bool>(empty)) << llvm::toString(empty.takeError());
  EXPECT_NE((*empty)->toYAML().find("path_rules: {}"), std::string::npos);
}

//===----------------------------------------------------------------------===//
// File Loading Tests
//===----------------------------------------------------------------------===//

class DaggerConfigFileTest : public TestTree {};

TEST_F(DaggerConfigFileTest, RelativeBaseDirIsAnchoredAtConfig) {
  writeFile("repo/tools/repo_dagger.yaml", "base_dir: ..\n");

  auto result = DaggerConfig::loadFromFile(path("repo/tools/repo_dagger.yaml"));
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  EXPECT_EQ((*result)->getRootDirectory(), path("repo/tools"));
  EXPECT_EQ((*result)->getResolvedBaseDir(), path("repo"));
}

TEST_F(DaggerConfigFileTest, AbsoluteBaseDirIsUsedAsIs) {
  makeDir("elsewhere");
  writeFile("repo_dagger.yaml", "base_dir: \"" + path("elsewhere") + "\"\n");

  auto result = DaggerConfig::loadFromFile(path("repo_dagger.yaml"));
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ((*result)->getResolvedBaseDir(), path("elsewhere"));
}

TEST_F(DaggerConfigFileTest, MissingFile) {
  auto result = DaggerConfig::loadFromFile(path("missing.yaml"));
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_NE(llvm::toString(result.takeError()).find("failed to read config"),
            std::string::npos);
}

TEST_F(DaggerConfigFileTest, InputFilesAreSortedAndUnique) {
  writeFile("tests/test_b.py");
  writeFile("tests/test_a.py");
  writeFile("tests/unit/test_c.py");
  writeFile("tests/helper.py");
  writeFile("repo_dagger.yaml",
            "inputs: [\"tests/**/test_*.py\", \"tests/test_a.py\"]\n");

  auto result = DaggerConfig::loadFromFile(path("repo_dagger.yaml"));
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto inputs = (*result)->resolveInputFiles();
  ASSERT_TRUE(static_cast<bool>(inputs)) << llvm::toString(inputs.takeError());
  EXPECT_EQ(*inputs, (Strings{"tests/test_a.py", "tests/test_b.py",
                              "tests/unit/test_c.py"}));

  (*result)->setInputs({"tests/helper.py", "nothing/*.py"});
  auto overridden = (*result)->resolveInputFiles();
  ASSERT_TRUE(static_cast<bool>(overridden))
      << llvm::toString(overridden.takeError());
  EXPECT_EQ(*overridden, (Strings{"tests/helper.py"}));
}

TEST_F(DaggerConfigFileTest, BadInputPattern) {
  writeFile("repo_dagger.yaml", "inputs: \"tests/{a,b\"\n");

  auto result = DaggerConfig::loadFromFile(path("repo_dagger.yaml"));
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());

  auto inputs = (*result)->resolveInputFiles();
  ASSERT_FALSE(static_cast<bool>(inputs));
  EXPECT_NE(llvm::toString(inputs.takeError())
                .find("error while collecting input files"),
            std::string::npos);
}

} // namespace
