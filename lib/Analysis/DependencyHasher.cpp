//===- DependencyHasher.cpp - Closure and digest pipeline -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Analysis/DependencyHasher.h"
#include "dagger/Support/OutputFile.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Endian.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SHA256.h"

#include <algorithm>
#include <atomic>
#include <thread>

#define DEBUG_TYPE "dagger-hasher"

using namespace dagger;

//===----------------------------------------------------------------------===//
// Content Hashes
//===----------------------------------------------------------------------===//

llvm::Expected<ContentHashTable>
dagger::computeContentHashes(const RelationMap &relations,
                             llvm::StringRef baseDir) {
  ContentHashTable table;
  for (const auto &entry : relations) {
    llvm::SmallString<256> path(baseDir);
    llvm::sys::path::append(path, entry.first);
    auto bufferOrErr =
        llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                    /*RequiresNullTerminator=*/false);
    if (auto ec = bufferOrErr.getError())
      return llvm::createStringError(ec, "error while reading file '%s': %s",
                                     path.c_str(), ec.message().c_str());
    table[entry.first] = llvm::SHA256::hash(
        llvm::arrayRefFromStringRef((*bufferOrErr)->getBuffer()));
  }
  LLVM_DEBUG(llvm::dbgs() << "Hashed " << table.size() << " files\n");
  return std::move(table);
}

//===----------------------------------------------------------------------===//
// Closures and Digests
//===----------------------------------------------------------------------===//

std::vector<std::string> dagger::computeClosure(const RelationMap &relations,
                                                llvm::StringRef file) {
  llvm::StringSet<> visited;
  std::vector<std::string> closure;
  std::vector<llvm::StringRef> worklist;

  visited.insert(file);
  worklist.push_back(file);
  while (!worklist.empty()) {
    llvm::StringRef current = worklist.back();
    worklist.pop_back();
    closure.push_back(current.str());

    auto it = relations.find(current.str());
    if (it == relations.end())
      continue;
    for (const auto &related : it->second)
      if (visited.insert(related).second)
        worklist.push_back(related);
  }

  std::sort(closure.begin(), closure.end());
  return closure;
}

llvm::Expected<std::string>
dagger::computeDependencyDigest(llvm::StringRef file,
                                llvm::ArrayRef<std::string> closure,
                                const ContentHashTable &contentHashes,
                                const DigestParameters &params) {
  llvm::SHA256 hasher;

  uint8_t version[8];
  llvm::support::endian::write64le(version, params.algorithmVersion);
  hasher.update(llvm::ArrayRef<uint8_t>(version));
  hasher.update(params.salt);
  hasher.update(llvm::ArrayRef<uint8_t>(params.configHash));
  hasher.update(file);

  for (const auto &member : closure) {
    auto it = contentHashes.find(member);
    if (it == contentHashes.end())
      return llvm::createStringError(std::errc::invalid_argument,
                                     "no content hash for '%s'",
                                     member.c_str());
    hasher.update(member);
    hasher.update(llvm::ArrayRef<uint8_t>(it->second));
  }

  auto digest = hasher.final();
  return llvm::toHex(digest, /*LowerCase=*/true);
}

//===----------------------------------------------------------------------===//
// Statistics
//===----------------------------------------------------------------------===//

void dagger::sortFileStats(std::vector<FileStat> &stats,
                           StatsSortOrder order) {
  std::sort(stats.begin(), stats.end(),
            [order](const FileStat &a, const FileStat &b) {
              if (order == StatsSortOrder::Count && a.count != b.count)
                return a.count > b.count;
              return a.name < b.name;
            });
}

//===----------------------------------------------------------------------===//
// Pipeline
//===----------------------------------------------------------------------===//

namespace {

/// Shared state of one pipeline run. Each accumulator has its own lock.
struct PipelineState {
  PipelineState(const RelationMap &relations,
                llvm::ArrayRef<std::string> inputs,
                const ContentHashTable &contentHashes,
                const PipelineOptions &options, size_t numWorkers)
      : relations(relations), inputs(inputs), contentHashes(contentHashes),
        options(options), depStatsQueue(numWorkers),
        activeWorkers(numWorkers) {}

  void workerMain();
  void recordError(llvm::Error err);

  const RelationMap &relations;
  llvm::ArrayRef<std::string> inputs;
  const ContentHashTable &contentHashes;
  const PipelineOptions &options;

  std::atomic<size_t> nextInput{0};
  std::atomic<bool> stop{false};

  std::mutex digestsMutex;
  std::map<std::string, std::string> digests;

  std::mutex revDepMutex;
  llvm::StringMap<size_t> revDepCounts;

  std::mutex closureMutex;
  std::optional<std::vector<std::string>> requestedClosure;

  BoundedQueue<FileStat> depStatsQueue;
  std::atomic<size_t> activeWorkers;

  std::mutex errorMutex;
  std::string firstError;
};

} // namespace

void PipelineState::recordError(llvm::Error err) {
  std::string message = llvm::toString(std::move(err));
  {
    std::lock_guard<std::mutex> lock(errorMutex);
    if (firstError.empty())
      firstError = std::move(message);
  }
  stop.store(true);
}

void PipelineState::workerMain() {
  while (!stop.load()) {
    size_t index = nextInput.fetch_add(1);
    if (index >= inputs.size())
      break;

    const std::string &file = inputs[index];
    std::vector<std::string> closure = computeClosure(relations, file);

    if (file == options.closureFor) {
      std::lock_guard<std::mutex> lock(closureMutex);
      requestedClosure = closure;
    }

    if (options.collectDepStats &&
        !depStatsQueue.push(FileStat{file, closure.size()}))
      break;

    if (options.collectRevDepStats) {
      std::lock_guard<std::mutex> lock(revDepMutex);
      for (const auto &dep : closure)
        ++revDepCounts[dep];
    }

    if (options.computeDigests) {
      auto digestOrErr = computeDependencyDigest(file, closure, contentHashes,
                                                 options.digest);
      if (!digestOrErr) {
        recordError(llvm::createStringError(
            std::errc::invalid_argument,
            "error while hashing dependencies of '%s': %s", file.c_str(),
            llvm::toString(digestOrErr.takeError()).c_str()));
        break;
      }
      std::lock_guard<std::mutex> lock(digestsMutex);
      digests[file] = std::move(*digestOrErr);
    }
  }

  // The last worker out ends the statistics stream.
  if (activeWorkers.fetch_sub(1) == 1)
    depStatsQueue.close();
}

llvm::Expected<PipelineResult>
dagger::runHashPipeline(const RelationMap &relations,
                        llvm::ArrayRef<std::string> inputs,
                        const ContentHashTable &contentHashes,
                        const PipelineOptions &options) {
  size_t numWorkers = options.numThreads;
  if (numWorkers == 0)
    numWorkers = std::thread::hardware_concurrency();
  numWorkers = std::max<size_t>(1, std::min(numWorkers, inputs.size()));

  PipelineState state(relations, inputs, contentHashes, options, numWorkers);

  std::vector<std::thread> workers;
  workers.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i)
    workers.emplace_back(&PipelineState::workerMain, &state);
  LLVM_DEBUG(llvm::dbgs() << "Started " << numWorkers
                          << " hashing threads\n");

  // Drain the statistics stream while the workers run.
  PipelineResult result;
  FileStat stat;
  while (state.depStatsQueue.pop(stat))
    result.depStats.push_back(std::move(stat));

  for (auto &worker : workers)
    if (worker.joinable())
      worker.join();

  if (!state.firstError.empty())
    return llvm::createStringError(std::errc::invalid_argument, "%s",
                                   state.firstError.c_str());

  result.digests = std::move(state.digests);
  result.requestedClosure = std::move(state.requestedClosure);
  for (const auto &entry : state.revDepCounts)
    result.revDepStats.push_back(
        FileStat{entry.getKey().str(), entry.getValue()});

  sortFileStats(result.depStats, options.statsSort);
  sortFileStats(result.revDepStats, options.statsSort);
  return std::move(result);
}

llvm::json::Object
dagger::digestMapToJSON(const std::map<std::string, std::string> &digests) {
  llvm::json::Object object;
  for (const auto &entry : digests)
    object[toJSONKey(entry.first)] = entry.second;
  return object;
}
