#include "shrup/ProcessingContext.h"

#include "shrup/PathResolver.h"

namespace shrup {

ProcessingContext::ProcessingContext(const ProcessingConfig &config) : config_(config) {}

bool ProcessingContext::isActive(const std::filesystem::path &path) const {
  return active_.count(path.string()) > 0;
}

bool ProcessingContext::enter(const std::filesystem::path &path, IncludeError &error) {
  if (isActive(path)) {
    error = IncludeError{};
    error.kind = IncludeErrorKind::CircularDependency;
    error.path = path.string();
    std::string chain;
    for (const auto &entry : stack_) {
      error.includeChain.push_back(entry.string());
      chain += displayPath(config_.baseDirectory, entry) + " -> ";
    }
    error.includeChain.push_back(path.string());
    chain += displayPath(config_.baseDirectory, path);
    error.message = "Circular dependency detected: " + chain;
    return false;
  }
  if (stack_.size() + 1 > config_.maxIncludeDepth) {
    error = IncludeError{};
    error.kind = IncludeErrorKind::MaxDepthExceeded;
    error.path = path.string();
    error.maxDepth = config_.maxIncludeDepth;
    for (const auto &entry : stack_) {
      error.includeChain.push_back(entry.string());
    }
    error.includeChain.push_back(path.string());
    error.message = "Maximum include depth (" + std::to_string(config_.maxIncludeDepth) +
                    ") exceeded at: " + displayPath(config_.baseDirectory, path);
    return false;
  }
  stack_.push_back(path);
  active_.insert(path.string());
  return true;
}

void ProcessingContext::leave() {
  if (stack_.empty()) {
    return;
  }
  active_.erase(stack_.back().string());
  stack_.pop_back();
}

} // namespace shrup
