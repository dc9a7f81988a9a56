//===- Logging.cpp - Timestamped run log ----------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/Logging.h"

#include "llvm/Support/Format.h"

#include <chrono>
#include <ctime>

using namespace dagger;

Logger &Logger::get() {
  static Logger logger;
  return logger;
}

void Logger::setStream(llvm::raw_ostream *stream) {
  std::lock_guard<std::mutex> lock(mutex);
  os = stream;
}

static void printTimestamp(llvm::raw_ostream &os) {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch())
                    .count() %
                1000000;

  std::tm local;
  localtime_r(&seconds, &local);
  os << llvm::format("%02d:%02d:%02d.%06lld ", local.tm_hour, local.tm_min,
                     local.tm_sec, static_cast<long long>(micros));
}

void Logger::log(const llvm::Twine &message) {
  // Render outside the lock; the Twine may reference temporaries that are
  // expensive to print.
  std::string line;
  llvm::raw_string_ostream lineOS(line);
  if (timestamps)
    printTimestamp(lineOS);
  lineOS << message << '\n';
  lineOS.flush();

  std::lock_guard<std::mutex> lock(mutex);
  llvm::raw_ostream &out = os ? *os : llvm::errs();
  out << line;
  out.flush();
}
