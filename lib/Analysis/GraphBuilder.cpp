//===- GraphBuilder.cpp - Fixed-point relation graph ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/GraphBuilder.h"
#include "dagger/Support/Logging.h"
#include "dagger/Support/OutputFile.h"

#include "llvm/Support/Debug.h"

#include <algorithm>

#define DEBUG_TYPE "dagger-graph"

using namespace dagger;

void dagger::sortAndUnique(std::vector<std::string> &paths) {
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
}

GraphBuilder::GraphBuilder(const DaggerConfig &config, RelationEngine &engine)
    : config(config), engine(engine) {}

llvm::Expected<RelationMap>
GraphBuilder::build(llvm::ArrayRef<std::string> inputs) {
  RelationMap relations;
  numWaves = 0;

  std::vector<std::string> frontier(inputs.begin(), inputs.end());
  sortAndUnique(frontier);

  while (!frontier.empty()) {
    ++numWaves;
    logVerbose("---");
    LLVM_DEBUG(llvm::dbgs() << "Wave " << numWaves << ": " << frontier.size()
                            << " candidate files\n");

    std::vector<std::string> next;
    for (const auto &file : frontier) {
      // The map doubles as the processed set.
      auto inserted = relations.try_emplace(file);
      if (!inserted.second)
        continue;

      auto relatedOrErr = engine.visitFile(file);
      if (!relatedOrErr)
        return llvm::createStringError(
            std::errc::invalid_argument, "error while visiting file '%s': %s",
            file.c_str(), llvm::toString(relatedOrErr.takeError()).c_str());

      std::vector<std::string> related = std::move(*relatedOrErr);
      related.insert(related.end(), config.getGlobalDeps().begin(),
                     config.getGlobalDeps().end());
      sortAndUnique(related);

      next.insert(next.end(), related.begin(), related.end());
      inserted.first->second = std::move(related);
    }

    sortAndUnique(next);
    frontier = std::move(next);
  }

  LLVM_DEBUG(llvm::dbgs() << "Built relations for " << relations.size()
                          << " files in " << numWaves << " waves\n");
  return relations;
}

llvm::json::Object dagger::relationMapToJSON(const RelationMap &relations) {
  llvm::json::Object object;
  for (const auto &entry : relations)
    object[toJSONKey(entry.first)] = toJSONArray(entry.second);
  return object;
}
