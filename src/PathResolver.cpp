#include "shrup/PathResolver.h"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace shrup {
namespace {

void setError(IncludeError &error, IncludeErrorKind kind, const std::string &path, const std::string &message) {
  error = IncludeError{};
  error.kind = kind;
  error.path = path;
  error.message = message;
}

void setFilesystemError(IncludeError &error,
                        const std::filesystem::path &path,
                        const std::error_code &ec,
                        const std::string &action) {
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    setError(error, IncludeErrorKind::FileNotFound, path.string(), "File not found: " + path.string());
  } else if (ec == std::errc::permission_denied) {
    setError(error, IncludeErrorKind::PermissionDenied, path.string(), "Permission denied: " + path.string());
  } else {
    setError(error,
             IncludeErrorKind::IoError,
             path.string(),
             "IO error: failed to " + action + " " + path.string() + ": " + ec.message());
  }
}

} // namespace

bool isPathInside(const std::filesystem::path &base, const std::filesystem::path &path) {
  auto pathIt = path.begin();
  for (const auto &part : base) {
    if (part.empty()) {
      continue;
    }
    if (pathIt == path.end() || *pathIt != part) {
      return false;
    }
    ++pathIt;
  }
  return true;
}

std::string displayPath(const std::filesystem::path &base, const std::filesystem::path &path) {
  if (base.empty() || !isPathInside(base, path)) {
    return path.string();
  }
  std::string relative = path.lexically_relative(base).generic_string();
  if (relative.empty() || relative == ".") {
    return path.string();
  }
  return relative;
}

PathResolver::PathResolver(std::filesystem::path baseDirectory) : baseDirectory_(std::move(baseDirectory)) {}

bool PathResolver::canonicalize(const std::filesystem::path &path,
                                std::filesystem::path &canonical,
                                IncludeError &error) {
  std::error_code ec;
  std::filesystem::path result = std::filesystem::canonical(path, ec);
  if (ec) {
    setFilesystemError(error, path, ec, "canonicalize");
    return false;
  }
  canonical = std::move(result);
  return true;
}

bool PathResolver::checkReadableFile(const std::filesystem::path &path, IncludeError &error) {
  std::error_code ec;
  const std::filesystem::file_status status = std::filesystem::status(path, ec);
  if (ec) {
    setFilesystemError(error, path, ec, "stat");
    return false;
  }
  if (!std::filesystem::is_regular_file(status)) {
    setError(error,
             IncludeErrorKind::FileNotFound,
             path.string(),
             "File not found: " + path.string() + " is not a regular file");
    return false;
  }
  if (::access(path.c_str(), R_OK) != 0) {
    const int savedErrno = errno;
    if (savedErrno == EACCES || savedErrno == EPERM) {
      setError(error, IncludeErrorKind::PermissionDenied, path.string(), "Permission denied: " + path.string());
    } else {
      setError(error,
               IncludeErrorKind::IoError,
               path.string(),
               "IO error: cannot access " + path.string() + ": " + std::strerror(savedErrno));
    }
    return false;
  }
  return true;
}

bool PathResolver::resolve(const std::string &rawPath,
                           const std::filesystem::path &includingFile,
                           std::filesystem::path &resolved,
                           IncludeError &error) const {
  const std::filesystem::path requested(rawPath);
  std::filesystem::path candidate;
  if (requested.is_absolute()) {
    candidate = baseDirectory_ / requested.relative_path();
  } else {
    candidate = includingFile.parent_path() / requested;
  }

  // Nothing outside the base directory is reported beyond the raw spelling.
  if (!isPathInside(baseDirectory_, candidate.lexically_normal())) {
    setError(error, IncludeErrorKind::FileNotFound, rawPath, "File not found: " + rawPath);
    return false;
  }
  std::filesystem::path canonical;
  if (!canonicalize(candidate, canonical, error)) {
    return false;
  }
  if (!isPathInside(baseDirectory_, canonical)) {
    setError(error, IncludeErrorKind::FileNotFound, rawPath, "File not found: " + rawPath);
    return false;
  }
  if (!checkReadableFile(canonical, error)) {
    return false;
  }
  resolved = std::move(canonical);
  return true;
}

} // namespace shrup
