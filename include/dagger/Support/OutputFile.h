//===- OutputFile.h - JSON run artifacts ------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_SUPPORT_OUTPUTFILE_H
#define DAGGER_SUPPORT_OUTPUTFILE_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <string>

namespace dagger {

/// Convert a path to a JSON string, replacing invalid UTF-8 sequences.
llvm::json::Value toJSONString(llvm::StringRef value);

/// Convert a path to a JSON object key, replacing invalid UTF-8 sequences.
std::string toJSONKey(llvm::StringRef value);

/// Convert a list of paths to a JSON array.
llvm::json::Array toJSONArray(llvm::ArrayRef<std::string> values);

/// Write `value` followed by a newline to `path`. The file is only left behind
/// if it was written completely.
llvm::Error writeJSONFile(llvm::StringRef path, const llvm::json::Value &value);

} // namespace dagger

#endif // DAGGER_SUPPORT_OUTPUTFILE_H
