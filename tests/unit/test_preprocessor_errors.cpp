#include "shrup/Preprocessor.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace {
std::filesystem::path freshDir(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / "shrup_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return std::filesystem::canonical(dir);
}

std::string writeFile(const std::filesystem::path &path, const std::string &contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path);
  CHECK(file.good());
  file << contents;
  CHECK(file.good());
  return path.string();
}
} // namespace

TEST_SUITE_BEGIN("shrup.preprocessor.errors");

TEST_CASE("two file cycle names the chain") {
  const auto dir = freshDir("cycle_two");
  writeFile(dir / "b.sh", "echo b\n#include a.sh\n");
  const std::string input = writeFile(dir / "a.sh", "echo a\n#include b.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output = "untouched";
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::CircularDependency);
  CHECK(error.message.find("a.sh -> b.sh -> a.sh") != std::string::npos);
  CHECK(error.sourceFile == (dir / "b.sh").string());
  CHECK(error.line == 2);
  CHECK(error.includeChain.size() == 3);
  CHECK(output == "untouched");
}

TEST_CASE("self include is circular") {
  const auto dir = freshDir("cycle_self");
  const std::string input = writeFile(dir / "a.sh", "#include a.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::CircularDependency);
  CHECK(error.message.find("a.sh -> a.sh") != std::string::npos);
}

TEST_CASE("long cycle is detected") {
  const auto dir = freshDir("cycle_long");
  writeFile(dir / "f1.sh", "#include f2.sh\n");
  writeFile(dir / "f2.sh", "#include f3.sh\n");
  writeFile(dir / "f3.sh", "#include f4.sh\n");
  writeFile(dir / "f4.sh", "#include f2.sh\n");
  const std::string input = (dir / "f1.sh").string();

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::CircularDependency);
  CHECK(error.message.find("f1.sh -> f2.sh -> f3.sh -> f4.sh -> f2.sh") != std::string::npos);
}

TEST_CASE("cycle through differently spelled paths is detected") {
  const auto dir = freshDir("cycle_spelling");
  writeFile(dir / "lib" / "b.sh", "#include ../a.sh\n");
  const std::string input = writeFile(dir / "a.sh", "#include ./lib/../lib/b.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::CircularDependency);
}

TEST_CASE("cycle through symlink alias is detected") {
  const auto dir = freshDir("cycle_symlink");
  writeFile(dir / "b.sh", "#include alias.sh\n");
  const std::string input = writeFile(dir / "a.sh", "#include b.sh\n");
  std::filesystem::create_symlink(dir / "a.sh", dir / "alias.sh");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::CircularDependency);
}

TEST_CASE("chain deeper than max depth fails") {
  const auto dir = freshDir("depth_exceeded");
  writeFile(dir / "d4.sh", "echo d4\n");
  writeFile(dir / "d3.sh", "#include d4.sh\n");
  writeFile(dir / "d2.sh", "#include d3.sh\n");
  const std::string input = writeFile(dir / "d1.sh", "#include d2.sh\n");

  shrup::ProcessingConfig config;
  config.maxIncludeDepth = 3;
  shrup::Preprocessor preprocessor(config);
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::MaxDepthExceeded);
  CHECK(error.maxDepth == 3);
  CHECK(error.sourceFile == (dir / "d3.sh").string());
  CHECK(error.line == 1);
}

TEST_CASE("max depth of one rejects any include") {
  const auto dir = freshDir("depth_one");
  writeFile(dir / "lib.sh", "echo lib\n");
  const std::string input = writeFile(dir / "main.sh", "echo main\n#include lib.sh\n");

  shrup::ProcessingConfig config;
  config.maxIncludeDepth = 1;
  shrup::Preprocessor preprocessor(config);
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::MaxDepthExceeded);
}

TEST_CASE("missing include reports file and line") {
  const auto dir = freshDir("missing_include");
  writeFile(dir / "lib.sh", "echo lib\n\n#include \"gone.sh\"\n");
  const std::string input = writeFile(dir / "main.sh", "#include lib.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::FileNotFound);
  CHECK(error.sourceFile == (dir / "lib.sh").string());
  CHECK(error.line == 3);
  REQUIRE(error.includeChain.size() == 2);
  CHECK(error.includeChain[0] == (dir / "main.sh").string());
  CHECK(error.describe().find("lib.sh:3") != std::string::npos);
}

TEST_CASE("malformed directive in nested file aborts expansion") {
  const auto dir = freshDir("malformed_nested");
  writeFile(dir / "lib.sh", "echo ok\n#include <broken.sh\n");
  const std::string input = writeFile(dir / "main.sh", "#include lib.sh\necho after\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::InvalidIncludeDirective);
  CHECK(error.line == 2);
  CHECK(error.sourceFile == (dir / "lib.sh").string());
  CHECK(output.empty());
}

TEST_CASE("escaping the base directory is not found") {
  const auto dir = freshDir("escape");
  writeFile(dir / "secret.sh", "echo secret\n");
  const std::string input = writeFile(dir / "project" / "main.sh", "#include ../secret.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::FileNotFound);
}

TEST_CASE("missing input file is not found") {
  const auto dir = freshDir("missing_input");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile((dir / "absent.sh").string(), output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::FileNotFound);
}

TEST_CASE("unreadable include is permission denied" * doctest::skip(::geteuid() == 0)) {
  const auto dir = freshDir("unreadable_include");
  const auto locked = dir / "locked.sh";
  writeFile(locked, "echo locked\n");
  std::filesystem::permissions(locked, std::filesystem::perms::none);
  const std::string input = writeFile(dir / "main.sh", "#include locked.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::PermissionDenied);
  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
}

TEST_CASE("symlink loop include is an io error at the directive") {
  const auto dir = freshDir("symlink_loop_include");
  std::filesystem::create_symlink(dir / "l2", dir / "l1");
  std::filesystem::create_symlink(dir / "l1", dir / "l2");
  const std::string input = writeFile(dir / "loop.sh", "echo before\n#include l1\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  CHECK(error.kind == shrup::IncludeErrorKind::IoError);
  CHECK(error.sourceFile == input);
  CHECK(error.line == 2);
  CHECK(error.describe().find("loop.sh:2") != std::string::npos);
}

TEST_CASE("failed expansion does not poison later runs") {
  const auto dir = freshDir("rerun_after_failure");
  writeFile(dir / "lib.sh", "#include missing.sh\n");
  const std::string input = writeFile(dir / "main.sh", "#include lib.sh\n");

  shrup::Preprocessor preprocessor;
  std::string output;
  shrup::IncludeError error;
  CHECK_FALSE(preprocessor.processFile(input, output, error));
  writeFile(dir / "missing.sh", "echo found\n");
  CHECK(preprocessor.processFile(input, output, error));
  CHECK(error.ok());
  CHECK(output == "echo found\n");
}

TEST_CASE("describe appends location") {
  shrup::IncludeError error;
  error.kind = shrup::IncludeErrorKind::FileNotFound;
  error.message = "File not found: x.sh";
  error.sourceFile = "/srv/main.sh";
  error.line = 4;
  CHECK(error.describe() == "File not found: x.sh (in /srv/main.sh:4)");
  CHECK(std::string(shrup::includeErrorKindName(shrup::IncludeErrorKind::CircularDependency)) ==
        "circular dependency");
}

TEST_SUITE_END();
