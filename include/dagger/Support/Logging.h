//===- Logging.h - Timestamped run log --------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The run log is the line-oriented stream on which repo-dagger reports its
// progress and statistics. Every line is prefixed with the local wall-clock
// time (HH:MM:SS.uuuuuu). Lines may be emitted from worker threads; each line
// is written atomically.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_SUPPORT_LOGGING_H
#define DAGGER_SUPPORT_LOGGING_H

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>

namespace dagger {

class Logger {
public:
  /// Return the process-wide logger. It writes to llvm::errs() until
  /// redirected.
  static Logger &get();

  /// Redirect the log. Passing nullptr restores llvm::errs().
  void setStream(llvm::raw_ostream *os);

  /// Enable or disable the verbose channel.
  void setVerbose(bool enabled) { verboseEnabled = enabled; }
  bool isVerbose() const { return verboseEnabled; }

  /// Disable the timestamp prefix. Tests use this to compare output.
  void setTimestamps(bool enabled) { timestamps = enabled; }

  /// Write one line.
  void log(const llvm::Twine &message);

  /// Write one line if the verbose channel is enabled.
  void verbose(const llvm::Twine &message) {
    if (verboseEnabled)
      log(message);
  }

private:
  Logger() = default;

  std::mutex mutex;
  llvm::raw_ostream *os = nullptr;
  bool verboseEnabled = false;
  bool timestamps = true;
};

/// Shorthands for the process-wide logger.
inline void logMessage(const llvm::Twine &message) {
  Logger::get().log(message);
}
inline void logVerbose(const llvm::Twine &message) {
  Logger::get().verbose(message);
}

} // namespace dagger

#endif // DAGGER_SUPPORT_LOGGING_H
