#pragma once
#include <stdexcept>
#include <string>

class CanaryError : public std::runtime_error {
public:
  explicit CanaryError(const std::string& message) : std::runtime_error(message) {}
  virtual const char* kind() const noexcept = 0;
};

// Lifecycle transition attempted from the wrong state.
class InvalidStateError : public CanaryError {
public:
  explicit InvalidStateError(const std::string& message) : CanaryError(message) {}
  const char* kind() const noexcept override { return "invalid_state"; }
};

class ModelLoadError : public CanaryError {
public:
  ModelLoadError(const std::string& path, const std::string& reason, bool not_found = false)
      : CanaryError("Failed to load model '" + path + "': " + reason),
        path_(path),
        not_found_(not_found) {}
  const char* kind() const noexcept override { return "model_load"; }
  const std::string& path() const { return path_; }
  bool not_found() const { return not_found_; }

private:
  std::string path_;
  bool not_found_;
};

class InvalidInputError : public CanaryError {
public:
  explicit InvalidInputError(const std::string& message) : CanaryError(message) {}
  const char* kind() const noexcept override { return "invalid_input"; }
};
