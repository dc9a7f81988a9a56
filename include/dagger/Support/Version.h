//===- Version.h - repo-dagger version information --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_SUPPORT_VERSION_H
#define DAGGER_SUPPORT_VERSION_H

#include <cstdint>

namespace dagger {

/// Release version of the tool.
constexpr const char *kDaggerVersion = "1.4.0";

/// Version of the digest algorithm. Bump this whenever the tool may produce a
/// different digest for the same tree and configuration; doing so invalidates
/// every previously stored cache key at once.
constexpr uint64_t kAlgorithmVersion = 1;

} // namespace dagger

#endif // DAGGER_SUPPORT_VERSION_H
