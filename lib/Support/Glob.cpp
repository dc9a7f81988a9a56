//===- Glob.cpp - Path glob matching and expansion ------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements extended glob matching on top of llvm::GlobPattern and
// the directory walk used to enumerate matches.
//
//===----------------------------------------------------------------------===//

#include "dagger/Support/Glob.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>

#define DEBUG_TYPE "dagger-glob"

using namespace dagger;

//===----------------------------------------------------------------------===//
// Path Helpers
//===----------------------------------------------------------------------===//

std::string dagger::joinRelative(llvm::StringRef dir, llvm::StringRef path) {
  if (dir.empty() || dir == ".")
    return path.str();
  if (path.empty())
    return dir.str();
  return (dir + "/" + path).str();
}

llvm::StringRef dagger::parentDirectory(llvm::StringRef path) {
  size_t pos = path.rfind('/');
  if (pos == llvm::StringRef::npos || pos == 0)
    return ".";
  return path.substr(0, pos);
}

/// Split a '/'-separated path, dropping empty and "." components.
static void splitPath(llvm::StringRef path,
                      llvm::SmallVectorImpl<llvm::StringRef> &parts) {
  llvm::SmallVector<llvm::StringRef, 8> raw;
  path.split(raw, '/');
  for (auto part : raw)
    if (!part.empty() && part != ".")
      parts.push_back(part);
}

//===----------------------------------------------------------------------===//
// Brace Expansion
//===----------------------------------------------------------------------===//

/// Find the end of a bracket expression starting at `open`, or npos.
static size_t findBracketEnd(llvm::StringRef pattern, size_t open) {
  size_t i = open + 1;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^'))
    ++i;
  // A ']' right after the opening bracket is part of the set.
  if (i < pattern.size() && pattern[i] == ']')
    ++i;
  for (; i < pattern.size(); ++i)
    if (pattern[i] == ']')
      return i;
  return llvm::StringRef::npos;
}

llvm::Expected<std::vector<std::string>>
dagger::expandBraces(llvm::StringRef pattern) {
  // Locate the first top-level '{'.
  size_t open = llvm::StringRef::npos;
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (c == '[') {
      size_t end = findBracketEnd(pattern, i);
      if (end != llvm::StringRef::npos)
        i = end;
      continue;
    }
    if (c == '{') {
      open = i;
      break;
    }
  }
  if (open == llvm::StringRef::npos)
    return std::vector<std::string>{pattern.str()};

  // Split the group at top-level commas and find its closing brace.
  llvm::SmallVector<llvm::StringRef, 4> choices;
  size_t depth = 0;
  size_t choiceStart = open + 1;
  size_t close = llvm::StringRef::npos;
  for (size_t i = open + 1; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (c == '[') {
      size_t end = findBracketEnd(pattern, i);
      if (end != llvm::StringRef::npos)
        i = end;
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (depth == 0) {
        choices.push_back(pattern.slice(choiceStart, i));
        close = i;
        break;
      }
      --depth;
    } else if (c == ',' && depth == 0) {
      choices.push_back(pattern.slice(choiceStart, i));
      choiceStart = i + 1;
    }
  }
  if (close == llvm::StringRef::npos)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "unterminated '{' in glob pattern '%s'",
                                   pattern.str().c_str());

  llvm::StringRef prefix = pattern.substr(0, open);
  llvm::StringRef suffix = pattern.substr(close + 1);

  std::vector<std::string> result;
  for (auto choice : choices) {
    // Nested groups inside the choice and later groups in the suffix are
    // expanded by recursing on the recombined text.
    auto expanded = expandBraces((prefix + choice + suffix).str());
    if (!expanded)
      return expanded.takeError();
    result.insert(result.end(), expanded->begin(), expanded->end());
  }
  return result;
}

//===----------------------------------------------------------------------===//
// PathGlob
//===----------------------------------------------------------------------===//

bool PathGlob::Segment::matches(llvm::StringRef name) const {
  switch (kind) {
  case Kind::Literal:
    return name == *text;
  case Kind::Wildcard:
    return glob->match(name);
  case Kind::Recursive:
    return true;
  }
  llvm_unreachable("invalid segment kind");
}

llvm::Expected<PathGlob> PathGlob::create(llvm::StringRef pattern) {
  if (llvm::sys::path::is_absolute(pattern, llvm::sys::path::Style::posix))
    return llvm::createStringError(std::errc::invalid_argument,
                                   "glob pattern '%s' must be relative",
                                   pattern.str().c_str());

  auto expanded = expandBraces(pattern);
  if (!expanded)
    return expanded.takeError();

  PathGlob result;
  result.pattern = pattern.str();

  for (const auto &text : *expanded) {
    llvm::SmallVector<llvm::StringRef, 8> parts;
    splitPath(text, parts);

    Alternative alternative;
    for (auto part : parts) {
      if (part == "..")
        return llvm::createStringError(
            std::errc::invalid_argument,
            "glob pattern '%s' must not contain '..'", pattern.str().c_str());

      Segment segment;
      segment.text = std::make_shared<const std::string>(part.str());
      if (part == "**") {
        // Consecutive '**' segments are equivalent to one.
        if (!alternative.empty() &&
            alternative.back().kind == Segment::Kind::Recursive)
          continue;
        segment.kind = Segment::Kind::Recursive;
      } else if (part.find_first_of("*?[\\") != llvm::StringRef::npos) {
        auto globOrErr = llvm::GlobPattern::create(*segment.text);
        if (!globOrErr)
          return llvm::createStringError(
              std::errc::invalid_argument, "invalid glob pattern '%s': %s",
              pattern.str().c_str(),
              llvm::toString(globOrErr.takeError()).c_str());
        segment.kind = Segment::Kind::Wildcard;
        segment.glob.emplace(std::move(*globOrErr));
      }
      alternative.push_back(std::move(segment));
    }
    result.alternatives.push_back(std::move(alternative));
  }

  return std::move(result);
}

bool PathGlob::isLiteral() const {
  if (alternatives.size() != 1)
    return false;
  return llvm::all_of(alternatives.front(), [](const Segment &segment) {
    return segment.kind == Segment::Kind::Literal;
  });
}

static bool matchSegments(llvm::ArrayRef<PathGlob::Segment> segments,
                          llvm::ArrayRef<llvm::StringRef> parts) {
  while (!segments.empty()) {
    const auto &segment = segments.front();
    if (segment.kind == PathGlob::Segment::Kind::Recursive) {
      for (size_t skip = 0; skip <= parts.size(); ++skip)
        if (matchSegments(segments.drop_front(), parts.drop_front(skip)))
          return true;
      return false;
    }
    if (parts.empty() || !segment.matches(parts.front()))
      return false;
    segments = segments.drop_front();
    parts = parts.drop_front();
  }
  return parts.empty();
}

bool PathGlob::match(llvm::StringRef path) const {
  llvm::SmallVector<llvm::StringRef, 8> parts;
  splitPath(path, parts);
  for (const auto &alternative : alternatives)
    if (matchSegments(alternative, parts))
      return true;
  return false;
}

llvm::Expected<bool> dagger::matchGlob(llvm::StringRef pattern,
                                       llvm::StringRef path) {
  auto globOrErr = PathGlob::create(pattern);
  if (!globOrErr)
    return globOrErr.takeError();
  return globOrErr->match(path);
}

//===----------------------------------------------------------------------===//
// Expansion
//===----------------------------------------------------------------------===//

namespace {

/// A directory entry as seen by the walk.
struct WalkEntry {
  std::string name;
  bool isDirectory = false;
  bool isSymlink = false;
};

static bool isMissing(std::error_code ec) {
  return ec == std::errc::no_such_file_or_directory ||
         ec == std::errc::not_a_directory;
}

/// Walks the filesystem segment by segment, only listing the directories a
/// pattern can still match in.
class GlobWalker {
public:
  GlobWalker(llvm::StringRef root, bool filesOnly)
      : root(root), filesOnly(filesOnly) {}

  llvm::Error walk(const PathGlob::Alternative &segments, size_t index,
                   const std::string &relPath);

  std::vector<std::string> takeResults() {
    std::sort(results.begin(), results.end());
    results.erase(std::unique(results.begin(), results.end()), results.end());
    return std::move(results);
  }

private:
  std::string fullPath(llvm::StringRef relPath) const;
  llvm::Error listDirectory(llvm::StringRef relPath,
                            std::vector<WalkEntry> &entries) const;
  llvm::Error addMatch(const std::string &relPath);

  llvm::StringRef root;
  bool filesOnly;
  std::vector<std::string> results;
};

} // namespace

std::string GlobWalker::fullPath(llvm::StringRef relPath) const {
  if (relPath.empty())
    return root.empty() ? std::string(".") : root.str();
  if (root.empty())
    return relPath.str();
  llvm::SmallString<256> path(root);
  llvm::sys::path::append(path, relPath);
  return path.str().str();
}

llvm::Error GlobWalker::listDirectory(llvm::StringRef relPath,
                                      std::vector<WalkEntry> &entries) const {
  std::string dir = fullPath(relPath);
  std::error_code ec;
  llvm::sys::fs::directory_iterator it(dir, ec, /*follow_symlinks=*/false);
  llvm::sys::fs::directory_iterator end;
  if (ec) {
    if (isMissing(ec))
      return llvm::Error::success();
    return llvm::createStringError(ec, "error while reading directory '%s': %s",
                                   dir.c_str(), ec.message().c_str());
  }

  for (; it != end; it.increment(ec)) {
    if (ec)
      break;

    WalkEntry entry;
    entry.name = llvm::sys::path::filename(it->path()).str();

    auto type = it->type();
    if (type == llvm::sys::fs::file_type::type_unknown) {
      llvm::sys::fs::file_status status;
      if (auto statEc = llvm::sys::fs::status(it->path(), status,
                                              /*follow=*/false))
        return llvm::createStringError(statEc, "error while reading '%s': %s",
                                       it->path().c_str(),
                                       statEc.message().c_str());
      type = status.type();
    }

    if (type == llvm::sys::fs::file_type::symlink_file) {
      entry.isSymlink = true;
      llvm::sys::fs::file_status status;
      if (auto statEc = llvm::sys::fs::status(it->path(), status)) {
        // Dangling links resolve to nothing.
        if (isMissing(statEc))
          continue;
        return llvm::createStringError(statEc, "error while reading '%s': %s",
                                       it->path().c_str(),
                                       statEc.message().c_str());
      }
      type = status.type();
    }

    entry.isDirectory = type == llvm::sys::fs::file_type::directory_file;
    entries.push_back(std::move(entry));
  }
  if (ec)
    return llvm::createStringError(ec, "error while reading directory '%s': %s",
                                   dir.c_str(), ec.message().c_str());

  // Directory order is unspecified; keep the walk itself deterministic.
  std::sort(entries.begin(), entries.end(),
            [](const WalkEntry &a, const WalkEntry &b) {
              return a.name < b.name;
            });
  return llvm::Error::success();
}

llvm::Error GlobWalker::addMatch(const std::string &relPath) {
  if (relPath.empty())
    return llvm::Error::success();

  std::string path = fullPath(relPath);
  llvm::sys::fs::file_status status;
  if (auto ec = llvm::sys::fs::status(path, status)) {
    if (isMissing(ec))
      return llvm::Error::success();
    return llvm::createStringError(ec, "error while reading '%s': %s",
                                   path.c_str(), ec.message().c_str());
  }

  if (filesOnly && status.type() == llvm::sys::fs::file_type::directory_file)
    return llvm::Error::success();

  results.push_back(relPath);
  return llvm::Error::success();
}

llvm::Error GlobWalker::walk(const PathGlob::Alternative &segments,
                             size_t index, const std::string &relPath) {
  if (index == segments.size())
    return addMatch(relPath);

  const auto &segment = segments[index];
  bool isLast = index + 1 == segments.size();

  switch (segment.kind) {
  case PathGlob::Segment::Kind::Literal:
    return walk(segments, index + 1,
                joinRelative(relPath, segment.getText()));

  case PathGlob::Segment::Kind::Wildcard: {
    std::vector<WalkEntry> entries;
    if (auto err = listDirectory(relPath, entries))
      return err;
    for (const auto &entry : entries) {
      if (!segment.matches(entry.name))
        continue;
      if (!isLast && !entry.isDirectory)
        continue;
      if (auto err =
              walk(segments, index + 1, joinRelative(relPath, entry.name)))
        return err;
    }
    return llvm::Error::success();
  }

  case PathGlob::Segment::Kind::Recursive: {
    // '**' matching zero segments.
    if (auto err = walk(segments, index + 1, relPath))
      return err;

    std::vector<WalkEntry> entries;
    if (auto err = listDirectory(relPath, entries))
      return err;
    for (const auto &entry : entries) {
      std::string child = joinRelative(relPath, entry.name);
      if (entry.isDirectory) {
        if (entry.isSymlink)
          continue;
        if (auto err = walk(segments, index, child))
          return err;
      } else if (isLast) {
        if (auto err = addMatch(child))
          return err;
      }
    }
    return llvm::Error::success();
  }
  }
  llvm_unreachable("invalid segment kind");
}

llvm::Expected<std::vector<std::string>>
dagger::expandGlob(llvm::StringRef root, const PathGlob &glob, bool filesOnly) {
  LLVM_DEBUG(llvm::dbgs() << "Expanding '" << glob.getPattern() << "' under '"
                          << root << "'\n");
  GlobWalker walker(root, filesOnly);
  for (const auto &alternative : glob.getAlternatives())
    if (auto err = walker.walk(alternative, 0, ""))
      return std::move(err);
  return walker.takeResults();
}

llvm::Expected<std::vector<std::string>>
dagger::expandGlob(llvm::StringRef root, llvm::StringRef pattern,
                   bool filesOnly) {
  auto globOrErr = PathGlob::create(pattern);
  if (!globOrErr)
    return globOrErr.takeError();
  return expandGlob(root, *globOrErr, filesOnly);
}
