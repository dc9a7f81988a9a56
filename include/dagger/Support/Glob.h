//===- Glob.h - Path glob matching and expansion ----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Extended glob patterns over '/'-separated relative paths:
//
//   *       any run of characters within one path segment
//   ?       one character within a segment
//   [abc]   character classes, including ranges and [!...] negation
//   {a,b}   alternatives (may nest and span segments)
//   **      zero or more whole path segments
//
// Each segment is matched with llvm::GlobPattern. Patterns are always relative:
// absolute patterns and '..' segments are rejected.
//
//===----------------------------------------------------------------------===//

#ifndef DAGGER_SUPPORT_GLOB_H
#define DAGGER_SUPPORT_GLOB_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/GlobPattern.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dagger {

/// A compiled extended glob pattern.
class PathGlob {
public:
  /// Compile a pattern. Fails on malformed brackets or braces, absolute
  /// patterns, and patterns that step outside their root with '..'.
  static llvm::Expected<PathGlob> create(llvm::StringRef pattern);

  /// Match a relative, '/'-separated path.
  bool match(llvm::StringRef path) const;

  /// Return the source text of the pattern.
  llvm::StringRef getPattern() const { return pattern; }

  /// True if no segment of the pattern contains wildcards.
  bool isLiteral() const;

  struct Segment {
    enum class Kind {
      Literal,  /// Plain text, compared exactly
      Wildcard, /// Matched by a GlobPattern
      Recursive /// '**'
    };

    Kind kind = Kind::Literal;
    /// llvm::GlobPattern may point into the text it was created from, so the
    /// text lives in shared storage that survives copies of the segment.
    std::shared_ptr<const std::string> text;
    std::optional<llvm::GlobPattern> glob;

    llvm::StringRef getText() const { return *text; }
    bool matches(llvm::StringRef name) const;
  };

  /// One brace-free alternative of the pattern, split into segments.
  using Alternative = std::vector<Segment>;

  const std::vector<Alternative> &getAlternatives() const {
    return alternatives;
  }

private:
  PathGlob() = default;

  std::string pattern;
  std::vector<Alternative> alternatives;
};

/// Expand the '{a,b}' alternatives of a pattern. A pattern without braces
/// expands to itself.
llvm::Expected<std::vector<std::string>> expandBraces(llvm::StringRef pattern);

/// Match `path` against `pattern` without caching the compiled pattern.
llvm::Expected<bool> matchGlob(llvm::StringRef pattern, llvm::StringRef path);

/// Enumerate the paths under `root` matching `glob`. Results are relative to
/// `root`, '/'-separated, sorted and unique. With `filesOnly`, directories are
/// dropped from the result. A missing directory yields no matches; any other
/// filesystem error fails the whole expansion. '**' does not descend into
/// symlinked directories.
llvm::Expected<std::vector<std::string>>
expandGlob(llvm::StringRef root, const PathGlob &glob, bool filesOnly = true);

/// Compile and expand `pattern` under `root`.
llvm::Expected<std::vector<std::string>>
expandGlob(llvm::StringRef root, llvm::StringRef pattern,
           bool filesOnly = true);

/// Join a '/'-separated relative directory and a relative path. An empty or
/// "." directory yields `path` unchanged.
std::string joinRelative(llvm::StringRef dir, llvm::StringRef path);

/// Return the '/'-separated parent directory of a relative path, or "." for a
/// path without a directory component.
llvm::StringRef parentDirectory(llvm::StringRef path);

} // namespace dagger

#endif // DAGGER_SUPPORT_GLOB_H
