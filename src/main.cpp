#include "shrup/IncludeError.h"
#include "shrup/Options.h"
#include "shrup/Preprocessor.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace {
constexpr const char *Version = "0.1.0";

void printUsage(std::ostream &out) {
  out << "Usage: shrup [--debug] [--max-depth <n>] [--base-dir <dir>] <input> <output>\n"
         "       shrup --help | --version\n";
}

bool writeFile(const std::string &path, const std::string &contents) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file) {
    return false;
  }
  file << contents;
  return file.good();
}
} // namespace

int main(int argc, char **argv) {
  shrup::Options options;
  std::string argError;
  if (!shrup::parseArgs(argc, argv, options, argError)) {
    std::cerr << "Argument error: " << argError << "\n";
    printUsage(std::cerr);
    return 2;
  }
  if (options.showHelp) {
    printUsage(std::cout);
    return 0;
  }
  if (options.showVersion) {
    std::cout << "shrup " << Version << "\n";
    return 0;
  }

  std::error_code ec;
  if (!std::filesystem::exists(options.inputPath, ec)) {
    std::cerr << "Input error: input file does not exist: " << options.inputPath << "\n";
    return 1;
  }
  if (!std::filesystem::is_regular_file(options.inputPath, ec)) {
    std::cerr << "Input error: input path is not a file: " << options.inputPath << "\n";
    return 1;
  }

  shrup::Preprocessor preprocessor(shrup::makeProcessingConfig(options));
  std::string output;
  shrup::IncludeError error;
  if (!preprocessor.processFile(options.inputPath, output, error)) {
    std::cerr << "Include error: " << error.describe() << "\n";
    if (error.includeChain.size() > 1) {
      std::cerr << "  Include stack:\n";
      for (const auto &entry : error.includeChain) {
        std::cerr << "    " << entry << "\n";
      }
    }
    return 1;
  }
  if (!writeFile(options.outputPath, output)) {
    std::cerr << "Output error: failed to write " << options.outputPath << "\n";
    return 1;
  }
  if (options.debug) {
    std::cerr << "Processed " << options.inputPath << " -> " << options.outputPath << "\n";
  }
  return 0;
}
