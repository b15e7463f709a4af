#include "shrup/Options.h"

#include <cctype>
#include <vector>

namespace shrup {
namespace {

bool parsePositive(const std::string &text, size_t &out) {
  if (text.empty()) {
    return false;
  }
  size_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    const size_t digit = static_cast<size_t>(c - '0');
    if (value > (static_cast<size_t>(-1) - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  if (value == 0) {
    return false;
  }
  out = value;
  return true;
}

bool setMaxDepth(const std::string &text, Options &out, std::string &error) {
  if (!parsePositive(text, out.maxIncludeDepth)) {
    error = "max depth must be a positive integer: " + text;
    return false;
  }
  return true;
}

} // namespace

bool parseArgs(int argc, char **argv, Options &out, std::string &error) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--") {
      for (int j = i + 1; j < argc; ++j) {
        positional.push_back(argv[j]);
      }
      break;
    }
    if (arg == "--help" || arg == "-h") {
      out.showHelp = true;
    } else if (arg == "--version" || arg == "-V") {
      out.showVersion = true;
    } else if (arg == "--debug" || arg == "-d") {
      out.debug = true;
    } else if (arg == "--max-depth") {
      if (i + 1 >= argc) {
        error = "--max-depth requires a value";
        return false;
      }
      if (!setMaxDepth(argv[++i], out, error)) {
        return false;
      }
    } else if (arg.rfind("--max-depth=", 0) == 0) {
      if (!setMaxDepth(arg.substr(std::string("--max-depth=").size()), out, error)) {
        return false;
      }
    } else if (arg == "--base-dir") {
      if (i + 1 >= argc) {
        error = "--base-dir requires a value";
        return false;
      }
      out.baseDirectory = argv[++i];
    } else if (arg.rfind("--base-dir=", 0) == 0) {
      out.baseDirectory = arg.substr(std::string("--base-dir=").size());
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      positional.push_back(arg);
    }
  }
  if (out.showHelp || out.showVersion) {
    return true;
  }
  if (positional.size() != 2) {
    error = positional.size() < 2 ? "expected <input> and <output> paths" : "unexpected argument: " + positional[2];
    return false;
  }
  out.inputPath = positional[0];
  out.outputPath = positional[1];
  return true;
}

ProcessingConfig makeProcessingConfig(const Options &options) {
  ProcessingConfig config;
  config.debug = options.debug;
  config.maxIncludeDepth = options.maxIncludeDepth;
  if (!options.baseDirectory.empty()) {
    config.baseDirectory = options.baseDirectory;
  }
  return config;
}

} // namespace shrup
