#include "shrup/IncludeDirective.h"

#include <cctype>
#include <string_view>
#include <utility>

namespace shrup {
namespace {

constexpr std::string_view IncludeKeyword = "#include";

std::string trim(const std::string &value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

bool isDelimiter(char c) {
  return c == '<' || c == '>' || c == '"' || c == '\'';
}

char closingDelimiter(char open) {
  return open == '<' ? '>' : open;
}

IncludeQuoteStyle styleForDelimiter(char open) {
  if (open == '<') {
    return IncludeQuoteStyle::AngleBrackets;
  }
  if (open == '"') {
    return IncludeQuoteStyle::DoubleQuotes;
  }
  return IncludeQuoteStyle::SingleQuotes;
}

bool fail(const std::string &directive,
          size_t lineNumber,
          const std::string &sourceFile,
          const std::string &reason,
          IncludeError &error) {
  error = IncludeError{};
  error.kind = IncludeErrorKind::InvalidIncludeDirective;
  error.message = "Invalid include directive at line " + std::to_string(lineNumber) + ": " + directive + " (" +
                  reason + ")";
  error.sourceFile = sourceFile;
  error.line = lineNumber;
  return false;
}

} // namespace

bool parseIncludeDirective(const std::string &line,
                           size_t lineNumber,
                           const std::string &sourceFile,
                           IncludeDirective &out,
                           bool &found,
                           IncludeError &error) {
  found = false;
  const std::string directive = trim(line);
  if (directive.compare(0, IncludeKeyword.size(), IncludeKeyword) != 0) {
    return true;
  }
  if (directive.size() > IncludeKeyword.size() &&
      !std::isspace(static_cast<unsigned char>(directive[IncludeKeyword.size()]))) {
    return true;
  }
  const std::string argument = trim(directive.substr(IncludeKeyword.size()));
  if (argument.empty()) {
    return fail(directive, lineNumber, sourceFile, "missing include path", error);
  }

  IncludeDirective parsed;
  parsed.line = lineNumber;
  parsed.sourceFile = sourceFile;
  const char open = argument.front();
  if (open == '<' || open == '"' || open == '\'') {
    const char close = closingDelimiter(open);
    const size_t closePos = argument.find(close, 1);
    if (closePos == std::string::npos) {
      return fail(directive, lineNumber, sourceFile, std::string("missing closing ") + close, error);
    }
    if (closePos + 1 != argument.size()) {
      return fail(directive, lineNumber, sourceFile, "include path cannot have suffix", error);
    }
    parsed.path = argument.substr(1, closePos - 1);
    parsed.quoteStyle = styleForDelimiter(open);
  } else {
    for (char c : argument) {
      if (isDelimiter(c)) {
        return fail(directive, lineNumber, sourceFile, "unbalanced delimiter in unquoted include path", error);
      }
    }
    parsed.path = argument;
    parsed.quoteStyle = IncludeQuoteStyle::Unquoted;
  }
  if (trim(parsed.path).empty()) {
    return fail(directive, lineNumber, sourceFile, "empty include path", error);
  }
  out = std::move(parsed);
  found = true;
  return true;
}

} // namespace shrup
