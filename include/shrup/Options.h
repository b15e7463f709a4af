#pragma once

#include <cstddef>
#include <string>

#include "shrup/ProcessingContext.h"

namespace shrup {

struct Options {
  std::string inputPath;
  std::string outputPath;
  std::string baseDirectory;
  bool debug = false;
  size_t maxIncludeDepth = 100;
  bool showHelp = false;
  bool showVersion = false;
};

bool parseArgs(int argc, char **argv, Options &out, std::string &error);
ProcessingConfig makeProcessingConfig(const Options &options);

} // namespace shrup
