#include <algorithm>
#include <fstream>

#include <fmt/format.h>

#include <nres/fileio.hpp>

namespace fs = std::filesystem;

namespace nres {

namespace {

// Evaluate the bracket expression starting at pattern[pos] == '[' against c.
// Returns false when the bracket is never closed, in which case '[' is literal.
bool matchSet(std::string_view pattern, size_t pos, char c, bool &matched, size_t &end) {
  size_t i = pos + 1;
  bool negate = false;
  if (i < pattern.size() && pattern[i] == '!') {
    negate = true;
    ++i;
  }

  auto uc = static_cast<unsigned char>(c);
  size_t first = i;
  bool found = false;
  // A ']' right after the opening bracket is a member, not the terminator
  while (i < pattern.size() && (pattern[i] != ']' || i == first)) {
    auto lo = static_cast<unsigned char>(pattern[i]);
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      auto hi = static_cast<unsigned char>(pattern[i + 2]);
      found = found || (lo <= uc && uc <= hi);
      i += 3;
    } else {
      found = found || lo == uc;
      ++i;
    }
  }

  if (i >= pattern.size()) {
    return false;
  }
  end = i + 1;
  matched = found != negate;
  return true;
}

std::vector<fs::path> expandPattern(const std::string &pattern) {
  fs::path path(pattern);
  std::error_code ec;

  if (!hasWildcards(pattern)) {
    if (fs::exists(path, ec)) {
      return {path};
    }
    return {};
  }

  // Walk the pattern one component at a time, fanning out on wildcards
  std::vector<fs::path> current{path.root_path()};
  for (const auto &component : path.relative_path()) {
    std::string part = component.string();
    if (part.empty()) {
      continue;
    }

    std::vector<fs::path> next;
    for (const auto &base : current) {
      if (!hasWildcards(part)) {
        next.push_back(base / part);
        continue;
      }

      fs::path dir = base.empty() ? fs::path(".") : base;
      std::vector<fs::path> matches;
      for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (matchWildcard(part, name)) {
          matches.push_back(base / name);
        }
      }
      ec.clear();

      std::sort(matches.begin(), matches.end());
      next.insert(next.end(), matches.begin(), matches.end());
    }
    current = std::move(next);
  }

  std::vector<fs::path> result;
  for (auto &candidate : current) {
    if (fs::exists(candidate, ec)) {
      result.push_back(std::move(candidate));
    }
  }
  return result;
}

} // namespace

bool hasWildcards(std::string_view pattern) {
  return pattern.find_first_of("*?[") != std::string_view::npos;
}

bool matchWildcard(std::string_view pattern, std::string_view name) {
  if (!name.empty() && name.front() == '.' && (pattern.empty() || pattern.front() != '.')) {
    return false;
  }

  size_t p = 0;
  size_t n = 0;
  size_t starP = std::string_view::npos;
  size_t starN = 0;

  while (n < name.size()) {
    bool advanced = false;
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        starP = p++;
        starN = n;
        continue;
      }

      if (pc == '?') {
        ++p;
        advanced = true;
      } else if (pc == '[') {
        bool matched = false;
        size_t end = 0;
        if (matchSet(pattern, p, name[n], matched, end)) {
          if (matched) {
            p = end;
            advanced = true;
          }
        } else if (name[n] == '[') {
          ++p;
          advanced = true;
        }
      } else if (pc == name[n]) {
        ++p;
        advanced = true;
      }
    }

    if (advanced) {
      ++n;
    } else if (starP != std::string_view::npos) {
      // Let the last '*' swallow one more character
      p = starP + 1;
      n = ++starN;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

std::vector<fs::path> expandPatterns(const std::vector<std::string> &patterns) {
  std::vector<fs::path> paths;
  for (const auto &pattern : patterns) {
    auto matches = expandPattern(pattern);
    paths.insert(paths.end(), matches.begin(), matches.end());
  }
  return paths;
}

std::vector<fs::path> regularFiles(const std::vector<fs::path> &paths) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (const auto &path : paths) {
    if (fs::is_regular_file(path, ec)) {
      files.push_back(path);
    }
  }
  return files;
}

fs::path temporaryPathFor(const fs::path &dest) {
  return dest.parent_path() / fmt::format(".{}.partial", dest.filename().string());
}

bool commitFile(const fs::path &temp, const fs::path &dest, Error *outError) {
  std::error_code ec;
  fs::rename(temp, dest, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to move {} into place: {}", dest.string(), ec.message()));
    return false;
  }
  return true;
}

bool writeFileAtomic(const fs::path &dest, std::span<const uint8_t> data, Error *outError) {
  fs::path temp = temporaryPathFor(dest);
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      setError(outError, ErrorCode::IoError,
               fmt::format("Failed to create output file: {}", dest.string()));
      return false;
    }

    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
      std::error_code ignored;
      fs::remove(temp, ignored);
      setError(outError, ErrorCode::IoError,
               fmt::format("Failed to write to output file: {}", dest.string()));
      return false;
    }
  }
  return commitFile(temp, dest, outError);
}

bool DiskOutputPolicy::ensureDirectory(const fs::path &dir, bool simulate, Error *outError) {
  std::error_code ec;
  if (fs::exists(dir, ec) && !fs::is_directory(dir, ec)) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Output directory {} is a file", dir.string()));
    return false;
  }

  if (fs::is_directory(dir, ec)) {
    return true;
  }

  if (simulate) {
    reporter_.info(fmt::format("Dry-run: skipping creating directory at {}", dir.string()));
    return true;
  }

  reporter_.debug(fmt::format("Creating directory at {}", dir.string()));
  fs::create_directories(dir, ec);
  if (ec) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to create directory {}: {}", dir.string(), ec.message()));
    return false;
  }
  return true;
}

bool DiskOutputPolicy::mayWrite(const fs::path &path, bool force) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return true;
  }

  if (fs::is_directory(path, ec)) {
    reporter_.error(fmt::format("{} is a directory, skipping copying.", path.string()));
    return false;
  }

  if (fs::is_regular_file(path, ec) && !force) {
    reporter_.info(fmt::format("File {} already exists, skipping copying. "
                               "Use -f or --force to enable overwriting existing files.",
                               path.string()));
    return false;
  }

  return true;
}

} // namespace nres
