#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "shrup/IncludeError.h"

namespace shrup {

struct ProcessingConfig {
  bool debug = false;
  size_t maxIncludeDepth = 100;
  std::filesystem::path baseDirectory;
};

class ProcessingContext {
public:
  explicit ProcessingContext(const ProcessingConfig &config);
  ProcessingContext(ProcessingConfig &&) = delete;

  bool enter(const std::filesystem::path &path, IncludeError &error);
  void leave();

  bool isActive(const std::filesystem::path &path) const;
  size_t depth() const {
    return stack_.size();
  }
  const std::vector<std::filesystem::path> &stack() const {
    return stack_;
  }
  const ProcessingConfig &config() const {
    return config_;
  }

  // Holds one entry on the include stack and leaves it on destruction.
  struct Scope {
    ProcessingContext &context;
    bool entered = false;
    explicit Scope(ProcessingContext &contextIn) : context(contextIn) {}
    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;
    bool enter(const std::filesystem::path &path, IncludeError &error) {
      entered = context.enter(path, error);
      return entered;
    }
    ~Scope() {
      if (entered) {
        context.leave();
      }
    }
  };

private:
  const ProcessingConfig &config_;
  std::vector<std::filesystem::path> stack_;
  std::unordered_set<std::string> active_;
};

} // namespace shrup
