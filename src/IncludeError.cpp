#include "shrup/IncludeError.h"

namespace shrup {

const char *includeErrorKindName(IncludeErrorKind kind) {
  switch (kind) {
  case IncludeErrorKind::None:
    return "none";
  case IncludeErrorKind::InvalidIncludeDirective:
    return "invalid include directive";
  case IncludeErrorKind::FileNotFound:
    return "file not found";
  case IncludeErrorKind::PermissionDenied:
    return "permission denied";
  case IncludeErrorKind::CircularDependency:
    return "circular dependency";
  case IncludeErrorKind::MaxDepthExceeded:
    return "max depth exceeded";
  case IncludeErrorKind::IoError:
    return "io error";
  }
  return "unknown";
}

std::string IncludeError::describe() const {
  std::string text = message.empty() ? includeErrorKindName(kind) : message;
  if (!sourceFile.empty()) {
    text += " (in " + sourceFile;
    if (line > 0) {
      text += ":" + std::to_string(line);
    }
    text += ")";
  }
  return text;
}

} // namespace shrup
