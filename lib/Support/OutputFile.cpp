//===- OutputFile.cpp - JSON run artifacts --------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/OutputFile.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/ToolOutputFile.h"

using namespace dagger;

llvm::json::Value dagger::toJSONString(llvm::StringRef value) {
  return toJSONKey(value);
}

std::string dagger::toJSONKey(llvm::StringRef value) {
  if (llvm::json::isUTF8(value))
    return value.str();
  return llvm::json::fixUTF8(value);
}

llvm::json::Array dagger::toJSONArray(llvm::ArrayRef<std::string> values) {
  llvm::json::Array array;
  for (const auto &value : values)
    array.push_back(toJSONString(value));
  return array;
}

llvm::Error dagger::writeJSONFile(llvm::StringRef path,
                                  const llvm::json::Value &value) {
  std::error_code ec;
  llvm::ToolOutputFile output(path, ec, llvm::sys::fs::OF_Text);
  if (ec)
    return llvm::createStringError(ec, "error creating file '%s': %s",
                                   path.str().c_str(), ec.message().c_str());

  output.os() << value << '\n';
  output.os().flush();
  if (output.os().has_error()) {
    ec = output.os().error();
    output.os().clear_error();
    return llvm::createStringError(ec, "error writing file '%s': %s",
                                   path.str().c_str(), ec.message().c_str());
  }

  output.keep();
  return llvm::Error::success();
}
