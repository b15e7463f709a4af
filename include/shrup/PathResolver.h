#pragma once

#include <filesystem>
#include <string>

#include "shrup/IncludeError.h"

namespace shrup {

// Both paths are expected in canonical form.
bool isPathInside(const std::filesystem::path &base, const std::filesystem::path &path);
// Base-relative spelling for paths inside base, the full path otherwise.
std::string displayPath(const std::filesystem::path &base, const std::filesystem::path &path);

class PathResolver {
public:
  explicit PathResolver(std::filesystem::path baseDirectory);

  // Maps a raw include path to a canonical file inside the base directory.
  // Relative paths are taken from the including file's directory; absolute
  // ones are rooted at the base directory.
  bool resolve(const std::string &rawPath,
               const std::filesystem::path &includingFile,
               std::filesystem::path &resolved,
               IncludeError &error) const;

  static bool canonicalize(const std::filesystem::path &path,
                           std::filesystem::path &canonical,
                           IncludeError &error);
  static bool checkReadableFile(const std::filesystem::path &path, IncludeError &error);

private:
  std::filesystem::path baseDirectory_;
};

} // namespace shrup
