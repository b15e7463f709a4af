#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace shrup {

enum class IncludeErrorKind {
  None,
  InvalidIncludeDirective,
  FileNotFound,
  PermissionDenied,
  CircularDependency,
  MaxDepthExceeded,
  IoError
};

const char *includeErrorKindName(IncludeErrorKind kind);

// First failure of an expansion. sourceFile/line locate the directive that
// triggered it; includeChain is the active stack at that point, outermost first.
struct IncludeError {
  IncludeErrorKind kind = IncludeErrorKind::None;
  std::string message;
  std::string path;
  std::string sourceFile;
  size_t line = 0;
  size_t maxDepth = 0;
  std::vector<std::string> includeChain;

  bool ok() const {
    return kind == IncludeErrorKind::None;
  }
  std::string describe() const;
};

} // namespace shrup
