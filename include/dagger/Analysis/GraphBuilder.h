//===- GraphBuilder.h - Fixed-point relation graph --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The graph builder applies the relation engine to the input files, then to
// every file they relate to, wave by wave, until no new file turns up. The
// result maps every reached file to its sorted, unique direct relations.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_ANALYSIS_GRAPHBUILDER_H
#define DAGGER_ANALYSIS_GRAPHBUILDER_H

#include "dagger/Analysis/RelationEngine.h"
#include "dagger/Support/DaggerConfig.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <map>
#include <string>
#include <vector>

namespace dagger {

/// Maps a file to its sorted, unique direct relations. Ordered so iteration is
/// deterministic.
using RelationMap = std::map<std::string, std::vector<std::string>>;

/// Sort a list of paths and drop duplicates.
void sortAndUnique(std::vector<std::string> &paths);

class GraphBuilder {
public:
  GraphBuilder(const DaggerConfig &config, RelationEngine &engine);

  /// Build the relation map reachable from `inputs`. Every file reached
  /// relates to the configured global dependencies in addition to what the
  /// engine reports for it.
  llvm::Expected<RelationMap> build(llvm::ArrayRef<std::string> inputs);

  /// Number of waves run by the last build.
  unsigned getNumWaves() const { return numWaves; }

private:
  const DaggerConfig &config;
  RelationEngine &engine;
  unsigned numWaves = 0;
};

/// Convert a relation map to a JSON object of arrays.
llvm::json::Object relationMapToJSON(const RelationMap &relations);

} // namespace dagger

#endif // DAGGER_ANALYSIS_GRAPHBUILDER_H
