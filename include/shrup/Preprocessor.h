#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "shrup/IncludeError.h"
#include "shrup/PathResolver.h"
#include "shrup/ProcessingContext.h"

namespace shrup {

class Preprocessor {
public:
  explicit Preprocessor(ProcessingConfig config = {});

  bool processFile(const std::string &inputPath, std::string &output, IncludeError &error) const;

  bool expand(const std::filesystem::path &path,
              ProcessingContext &context,
              const PathResolver &resolver,
              std::vector<std::string> &lines,
              IncludeError &error) const;

private:
  bool expandContent(const std::filesystem::path &path,
                     const std::string &content,
                     ProcessingContext &context,
                     const PathResolver &resolver,
                     std::vector<std::string> &lines,
                     IncludeError &error) const;

  ProcessingConfig config_;
};

} // namespace shrup
