#pragma once

#include <cstddef>
#include <string>

#include "shrup/IncludeError.h"

namespace shrup {

enum class IncludeQuoteStyle { AngleBrackets, DoubleQuotes, SingleQuotes, Unquoted };

struct IncludeDirective {
  size_t line = 0;
  std::string path;
  IncludeQuoteStyle quoteStyle = IncludeQuoteStyle::Unquoted;
  std::string sourceFile;
};

// Returns false with error set when the line is a malformed #include.
// Returns true otherwise; found reports whether out was filled.
bool parseIncludeDirective(const std::string &line,
                           size_t lineNumber,
                           const std::string &sourceFile,
                           IncludeDirective &out,
                           bool &found,
                           IncludeError &error);

} // namespace shrup
