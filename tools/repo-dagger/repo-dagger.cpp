//===- repo-dagger.cpp - Dependency digests for source trees --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the 'repo-dagger' tool. It discovers how the files of a
// source tree relate to each other using the rules of a YAML configuration,
// and derives for every input file a digest covering the file and everything
// it transitively depends on.
//
// Usage:
//   repo-dagger -config repo_dagger.yaml -out-dep-hashes hashes.json
//   repo-dagger -config repo_dagger.yaml -print-dep-stats -stats-sort name
//   repo-dagger -config repo_dagger.yaml -out-recursive-deps deps.json \
//               -out-recursive-deps-for tests/test_foo.py
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/DependencyHasher.h"
#include "dagger/Analysis/GraphBuilder.h"
#include "dagger/Analysis/PythonModuleResolver.h"
#include "dagger/Analysis/RelationEngine.h"
#include "dagger/Support/DaggerConfig.h"
#include "dagger/Support/Logging.h"
#include "dagger/Support/OutputFile.h"
#include "dagger/Support/Version.h"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Timer.h"
#include "llvm/Support/ToolOutputFile.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

namespace cl = llvm::cl;
using namespace dagger;
using llvm::WithColor;

//===----------------------------------------------------------------------===//
// Command-line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("repo-dagger Options");

static cl::opt<std::string> configPath("config",
                                       cl::desc("Path to config file"),
                                       cl::value_desc("filename"),
                                       cl::cat(mainCategory));

static cl::opt<bool> verbose("verbose", cl::desc("Verbose output"),
                             cl::cat(mainCategory));

static cl::list<std::string> inputFiles(
    "input-files",
    cl::desc("Comma separated list of input files (overrides config)"),
    cl::value_desc("patterns"), cl::CommaSeparated, cl::cat(mainCategory));

static cl::opt<bool>
    printDepStats("print-dep-stats",
                  cl::desc("Print forward dependency statistics"),
                  cl::cat(mainCategory));

static cl::opt<bool>
    printRevDepStats("print-rev-dep-stats",
                     cl::desc("Print reverse dependency statistics"),
                     cl::cat(mainCategory));

static cl::opt<StatsSortOrder> statsSort(
    "stats-sort", cl::desc("Sort statistics by"),
    cl::values(clEnumValN(StatsSortOrder::Count, "count",
                          "Descending count, then name"),
               clEnumValN(StatsSortOrder::Name, "name", "File name")),
    cl::init(StatsSortOrder::Count), cl::cat(mainCategory));

static cl::opt<bool>
    selfProfile("self-profile",
                cl::desc("Write phase timings to 'repo_dagger.prof'"),
                cl::cat(mainCategory));

static cl::opt<std::string>
    outDepHashes("out-dep-hashes",
                 cl::desc("Output dependency hashes to the specified file"),
                 cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string>
    outRelations("out-relations",
                 cl::desc("Output relations to the specified file"),
                 cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string> outRecursiveDeps(
    "out-recursive-deps",
    cl::desc("Output recursive dependencies of the input file specified in "
             "'-out-recursive-deps-for' to the specified file"),
    cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string> outRecursiveDepsFor(
    "out-recursive-deps-for",
    cl::desc("Output recursive dependencies for the specified input file to "
             "the file specified in '-out-recursive-deps'"),
    cl::value_desc("file"), cl::cat(mainCategory));

static cl::opt<std::string> hashSalt(
    "hash-salt",
    cl::desc("Include this string in the dependency hash calculation. Use for "
             "cache busting."),
    cl::value_desc("salt"), cl::cat(mainCategory));

static cl::opt<bool> shortVersion("v", cl::desc("Print version and exit"),
                                  cl::cat(mainCategory));

//===----------------------------------------------------------------------===//
// Helper Functions
//===----------------------------------------------------------------------===//

static void printVersion(llvm::raw_ostream &os) {
  os << "version\t" << kDaggerVersion << '\n';
}

namespace {
/// Timers for the phases reported by -self-profile.
struct PhaseTimers {
  llvm::TimerGroup group{"repo-dagger", "repo-dagger phase timings"};
  llvm::Timer config{"config", "Load configuration", group};
  llvm::Timer graph{"graph", "Build relation graph", group};
  llvm::Timer contentHashes{"content-hashes", "Hash file contents", group};
  llvm::Timer pipeline{"pipeline", "Closures, statistics and digests", group};

  llvm::Timer *get(llvm::Timer &timer) {
    return selfProfile ? &timer : nullptr;
  }
};
} // namespace

static llvm::Error writeProfile(PhaseTimers &timers) {
  std::error_code ec;
  llvm::ToolOutputFile output("repo_dagger.prof", ec,
                              llvm::sys::fs::OF_Text);
  if (ec)
    return llvm::createStringError(ec, "error creating profile file: %s",
                                   ec.message().c_str());
  timers.group.print(output.os(), /*ResetAfterPrint=*/true);
  output.keep();
  return llvm::Error::success();
}

static void printStats(llvm::ArrayRef<FileStat> stats) {
  for (const auto &stat : stats)
    logMessage(llvm::Twine(stat.count) + "\t" + stat.name);
}

//===----------------------------------------------------------------------===//
// Main Pipeline
//===----------------------------------------------------------------------===//

static llvm::Error execute(PhaseTimers &timers) {
  if (configPath.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "config path not specified");
  if (outRecursiveDeps.empty() != outRecursiveDepsFor.empty())
    return llvm::createStringError(
        std::errc::invalid_argument,
        "both -out-recursive-deps and -out-recursive-deps-for must be "
        "specified together");

  Logger::get().setVerbose(verbose);

  // Load the configuration.
  std::unique_ptr<DaggerConfig> config;
  {
    llvm::TimeRegion region(timers.get(timers.config));
    logMessage("Loading Config: " + configPath.getValue());
    auto configOrErr = DaggerConfig::loadFromFile(configPath);
    if (!configOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument, "failed to load config file: %s",
          llvm::toString(configOrErr.takeError()).c_str());
    config = std::move(*configOrErr);
  }

  std::vector<std::string> overrides;
  for (const auto &pattern : inputFiles)
    if (!pattern.empty())
      overrides.push_back(pattern);
  if (!overrides.empty())
    config->setInputs(std::move(overrides));

  if (verbose) {
    logMessage("Config:");
    logMessage(llvm::StringRef(config->toYAML()).rtrim());
  }

  std::string baseDir = config->getResolvedBaseDir();
  logMessage("Base Directory: " + baseDir);

  auto inputsOrErr = config->resolveInputFiles();
  if (!inputsOrErr)
    return inputsOrErr.takeError();
  const std::vector<std::string> &inputs = *inputsOrErr;
  if (inputs.empty()) {
    logMessage("No input files found. Exiting.");
    return llvm::Error::success();
  }

  // Build the relation graph.
  RelationMap relations;
  {
    llvm::TimeRegion region(timers.get(timers.graph));
    logMessage("Generating dependency graph");
    PythonModuleResolver resolver(*config, baseDir);
    RelationEngine engine(*config, baseDir, resolver);
    GraphBuilder builder(*config, engine);
    auto relationsOrErr = builder.build(inputs);
    if (!relationsOrErr)
      return llvm::createStringError(
          std::errc::invalid_argument, "error while visiting files: %s",
          llvm::toString(relationsOrErr.takeError()).c_str());
    relations = std::move(*relationsOrErr);
    logMessage("Visited " + llvm::Twine(relations.size()) + " files in " +
               llvm::Twine(builder.getNumWaves()) + " waves");
  }

  if (!outRelations.empty()) {
    logMessage("Writing relations to: " + outRelations.getValue());
    if (auto err = writeJSONFile(outRelations, relationMapToJSON(relations)))
      return err;
  }

  if (!printDepStats && !printRevDepStats && outDepHashes.empty() &&
      outRecursiveDeps.empty()) {
    logMessage("Done");
    return llvm::Error::success();
  }

  ContentHashTable contentHashes;
  if (!outDepHashes.empty()) {
    llvm::TimeRegion region(timers.get(timers.contentHashes));
    logMessage("Calculating file hashes");
    auto hashesOrErr = computeContentHashes(relations, baseDir);
    if (!hashesOrErr)
      return hashesOrErr.takeError();
    contentHashes = std::move(*hashesOrErr);
  }

  if (!outRecursiveDepsFor.empty() &&
      !std::binary_search(inputs.begin(), inputs.end(),
                          outRecursiveDepsFor.getValue()))
    WithColor::warning() << "'" << outRecursiveDepsFor.getValue()
                         << "' is not an input file; no recursive "
                            "dependencies will be written\n";

  PipelineOptions options;
  options.computeDigests = !outDepHashes.empty();
  options.collectDepStats = printDepStats;
  options.collectRevDepStats = printRevDepStats;
  options.statsSort = statsSort;
  options.closureFor = outRecursiveDepsFor.getValue();
  options.digest.salt = hashSalt.getValue();
  options.digest.configHash = config->getConfigHash();

  PipelineResult result;
  {
    llvm::TimeRegion region(timers.get(timers.pipeline));
    logMessage("Calculating dependency hashes");
    auto resultOrErr = runHashPipeline(relations, inputs, contentHashes,
                                       options);
    if (!resultOrErr)
      return resultOrErr.takeError();
    result = std::move(*resultOrErr);
  }

  if (result.requestedClosure) {
    logMessage("Writing recursive dependencies of " +
               outRecursiveDepsFor.getValue() +
               " to: " + outRecursiveDeps.getValue());
    if (auto err = writeJSONFile(outRecursiveDeps,
                                 toJSONArray(*result.requestedClosure)))
      return err;
  }

  if (printDepStats)
    printStats(result.depStats);

  if (!outDepHashes.empty()) {
    logMessage("Writing dependency hashes to: " + outDepHashes.getValue());
    if (auto err = writeJSONFile(outDepHashes, digestMapToJSON(result.digests)))
      return err;
  }

  if (printRevDepStats)
    printStats(result.revDepStats);

  logMessage("Done");
  return llvm::Error::success();
}

int main(int argc, char **argv) {
  llvm::InitLLVM y(argc, argv);

  cl::SetVersionPrinter(printVersion);
  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(
      argc, argv, "repo-dagger: dependency digests for source trees\n");

  if (shortVersion) {
    printVersion(llvm::outs());
    return 0;
  }

  PhaseTimers timers;
  llvm::Error err = execute(timers);
  if (selfProfile)
    err = llvm::joinErrors(std::move(err), writeProfile(timers));

  if (err) {
    WithColor::error() << llvm::toString(std::move(err)) << "\n";
    return 1;
  }
  return 0;
}
