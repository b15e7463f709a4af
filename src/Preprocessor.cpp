#include "shrup/Preprocessor.h"

#include "shrup/IncludeDirective.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace shrup {
namespace {

bool readFile(const std::filesystem::path &path, std::string &out, IncludeError &error) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    if (!PathResolver::checkReadableFile(path, error)) {
      return false;
    }
    error = IncludeError{};
    error.kind = IncludeErrorKind::IoError;
    error.path = path.string();
    error.message = "IO error: failed to open " + path.string();
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    error = IncludeError{};
    error.kind = IncludeErrorKind::IoError;
    error.path = path.string();
    error.message = "IO error: failed to read " + path.string();
    return false;
  }
  out = buffer.str();
  return true;
}

// A trailing newline terminates the last line rather than starting an empty one.
std::vector<std::string> splitLines(const std::string &content) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(content.substr(start));
      break;
    }
    lines.push_back(content.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

void locateError(IncludeError &error, const IncludeDirective &directive, const ProcessingContext &context) {
  if (error.sourceFile.empty()) {
    error.sourceFile = directive.sourceFile;
    error.line = directive.line;
  }
  if (error.includeChain.empty()) {
    for (const auto &entry : context.stack()) {
      error.includeChain.push_back(entry.string());
    }
  }
}

std::string includedMarker(const std::string &rawPath) {
  return "# --- Included from " + rawPath + " ---";
}

std::string endMarker(const std::string &rawPath) {
  return "# --- End of " + rawPath + " ---";
}

} // namespace

Preprocessor::Preprocessor(ProcessingConfig config) : config_(std::move(config)) {}

bool Preprocessor::processFile(const std::string &inputPath, std::string &output, IncludeError &error) const {
  error = IncludeError{};
  if (inputPath.empty()) {
    error.kind = IncludeErrorKind::FileNotFound;
    error.message = "File not found: no input path given";
    return false;
  }
  std::error_code ec;
  const std::filesystem::path absoluteInput = std::filesystem::absolute(inputPath, ec);
  if (ec) {
    error.kind = IncludeErrorKind::IoError;
    error.path = inputPath;
    error.message = "IO error: failed to resolve " + inputPath + ": " + ec.message();
    return false;
  }
  std::filesystem::path input;
  if (!PathResolver::canonicalize(absoluteInput, input, error)) {
    return false;
  }
  if (!PathResolver::checkReadableFile(input, error)) {
    return false;
  }

  ProcessingConfig runConfig = config_;
  const std::filesystem::path requestedBase =
      config_.baseDirectory.empty() ? input.parent_path() : config_.baseDirectory;
  if (!PathResolver::canonicalize(requestedBase, runConfig.baseDirectory, error)) {
    return false;
  }
  if (!std::filesystem::is_directory(runConfig.baseDirectory, ec)) {
    error = IncludeError{};
    error.kind = IncludeErrorKind::FileNotFound;
    error.path = runConfig.baseDirectory.string();
    error.message = "File not found: base directory " + runConfig.baseDirectory.string() + " is not a directory";
    return false;
  }

  std::string content;
  if (!readFile(input, content, error)) {
    return false;
  }

  PathResolver resolver(runConfig.baseDirectory);
  ProcessingContext context(runConfig);
  ProcessingContext::Scope scope(context);
  if (!scope.enter(input, error)) {
    return false;
  }
  std::vector<std::string> lines;
  if (!expandContent(input, content, context, resolver, lines, error)) {
    return false;
  }

  std::string result;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result.push_back('\n');
    }
    result.append(lines[i]);
  }
  if (!content.empty() && content.back() == '\n') {
    result.push_back('\n');
  }
  output = std::move(result);
  return true;
}

bool Preprocessor::expand(const std::filesystem::path &path,
                          ProcessingContext &context,
                          const PathResolver &resolver,
                          std::vector<std::string> &lines,
                          IncludeError &error) const {
  std::string content;
  if (!readFile(path, content, error)) {
    return false;
  }
  return expandContent(path, content, context, resolver, lines, error);
}

bool Preprocessor::expandContent(const std::filesystem::path &path,
                                 const std::string &content,
                                 ProcessingContext &context,
                                 const PathResolver &resolver,
                                 std::vector<std::string> &lines,
                                 IncludeError &error) const {
  const std::string sourceFile = path.string();
  size_t lineNumber = 0;
  for (auto &line : splitLines(content)) {
    ++lineNumber;
    IncludeDirective directive;
    bool found = false;
    if (!parseIncludeDirective(line, lineNumber, sourceFile, directive, found, error)) {
      locateError(error, directive, context);
      return false;
    }
    if (!found) {
      lines.push_back(std::move(line));
      continue;
    }

    std::filesystem::path target;
    if (!resolver.resolve(directive.path, path, target, error)) {
      locateError(error, directive, context);
      return false;
    }
    ProcessingContext::Scope scope(context);
    if (!scope.enter(target, error)) {
      locateError(error, directive, context);
      return false;
    }
    if (context.config().debug) {
      lines.push_back(includedMarker(directive.path));
    }
    if (!expand(target, context, resolver, lines, error)) {
      locateError(error, directive, context);
      return false;
    }
    if (context.config().debug) {
      lines.push_back(endMarker(directive.path));
    }
  }
  return true;
}

} // namespace shrup
