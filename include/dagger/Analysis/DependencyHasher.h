//===- DependencyHasher.h - Closure and digest pipeline ---------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file turns a relation map into per-input cache keys. The dependency
// digest of an input is a SHA-256 over, in order:
//
//   - the algorithm version, as 8 little-endian bytes
//   - the salt
//   - the 32-byte hash of the configuration file
//   - the input path
//   - for each file of the input's closure, in sorted order, its path
//     followed by the 32-byte SHA-256 of its content
//
// Inputs are processed by a fixed pool of worker threads.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_ANALYSIS_DEPENDENCYHASHER_H
#define DAGGER_ANALYSIS_DEPENDENCYHASHER_H

#include "dagger/Analysis/GraphBuilder.h"
#include "dagger/Support/DaggerConfig.h"
#include "dagger/Support/Version.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <array>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dagger {

//===----------------------------------------------------------------------===//
// Content Hashes
//===----------------------------------------------------------------------===//

/// SHA-256 digest of a file's content.
using ContentDigest = std::array<uint8_t, 32>;

/// Maps a file to its content digest. Filled before any dependency digest is
/// computed and read-only afterwards.
using ContentHashTable = llvm::StringMap<ContentDigest>;

/// Hash the content of every file that appears as a key of `relations`.
llvm::Expected<ContentHashTable>
computeContentHashes(const RelationMap &relations, llvm::StringRef baseDir);

//===----------------------------------------------------------------------===//
// Closures and Digests
//===----------------------------------------------------------------------===//

/// Return `file` and every file transitively related to it, sorted. Cycles
/// are visited once.
std::vector<std::string> computeClosure(const RelationMap &relations,
                                        llvm::StringRef file);

/// Inputs to a dependency digest besides the closure itself.
struct DigestParameters {
  std::string salt;
  ConfigHash configHash = {};
  uint64_t algorithmVersion = kAlgorithmVersion;
};

/// Compute the lowercase hex dependency digest of `file`. Fails if a closure
/// member has no content hash.
llvm::Expected<std::string>
computeDependencyDigest(llvm::StringRef file,
                        llvm::ArrayRef<std::string> closure,
                        const ContentHashTable &contentHashes,
                        const DigestParameters &params);

//===----------------------------------------------------------------------===//
// Statistics
//===----------------------------------------------------------------------===//

/// A file with an associated count: the size of its closure for an input, or
/// the number of inputs depending on it.
struct FileStat {
  std::string name;
  size_t count = 0;
};

enum class StatsSortOrder {
  /// Descending count, ties broken by name.
  Count,
  /// Ascending name.
  Name
};

void sortFileStats(std::vector<FileStat> &stats, StatsSortOrder order);

//===----------------------------------------------------------------------===//
// BoundedQueue
//===----------------------------------------------------------------------===//

/// A blocking FIFO with a fixed capacity. Producers block while it is full;
/// consumers block while it is empty and open.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : capacity(capacity ? capacity : 1) {}

  /// Append an item. Returns false if the queue was closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex);
    notFull.wait(lock, [this] { return closed || items.size() < capacity; });
    if (closed)
      return false;
    items.push_back(std::move(item));
    notEmpty.notify_one();
    return true;
  }

  /// Remove the oldest item. Returns false once the queue is closed and
  /// drained.
  bool pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex);
    notEmpty.wait(lock, [this] { return closed || !items.empty(); });
    if (items.empty())
      return false;
    item = std::move(items.front());
    items.pop_front();
    notFull.notify_one();
    return true;
  }

  /// Refuse further items and wake every waiter. Queued items can still be
  /// popped.
  void close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    notEmpty.notify_all();
    notFull.notify_all();
  }

private:
  std::mutex mutex;
  std::condition_variable notEmpty;
  std::condition_variable notFull;
  std::deque<T> items;
  size_t capacity;
  bool closed = false;
};

//===----------------------------------------------------------------------===//
// Pipeline
//===----------------------------------------------------------------------===//

struct PipelineOptions {
  /// Compute a dependency digest per input.
  bool computeDigests = false;

  /// Report the closure size of every input.
  bool collectDepStats = false;

  /// Report, per file, the number of inputs whose closure contains it.
  bool collectRevDepStats = false;

  StatsSortOrder statsSort = StatsSortOrder::Count;

  /// Input whose closure is returned in full. Empty for none.
  std::string closureFor;

  DigestParameters digest;

  /// Number of worker threads. Zero selects the hardware concurrency.
  unsigned numThreads = 0;
};

struct PipelineResult {
  /// Maps each input to its lowercase hex digest.
  std::map<std::string, std::string> digests;

  /// Sorted per `statsSort`.
  std::vector<FileStat> depStats;
  std::vector<FileStat> revDepStats;

  /// Closure of `closureFor`, if it is one of the inputs.
  std::optional<std::vector<std::string>> requestedClosure;
};

/// Compute closures, statistics and digests for every input concurrently.
/// `contentHashes` must cover the closure of every input when digests are
/// requested. The first failing worker stops the others; its error is
/// returned once all workers have been joined.
llvm::Expected<PipelineResult>
runHashPipeline(const RelationMap &relations,
                llvm::ArrayRef<std::string> inputs,
                const ContentHashTable &contentHashes,
                const PipelineOptions &options);

/// Convert a digest table to a JSON object.
llvm::json::Object
digestMapToJSON(const std::map<std::string, std::string> &digests);

} // namespace dagger

#endif // DAGGER_ANALYSIS_DEPENDENCYHASHER_H
