#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "internal/validation/validation_result.hpp"

namespace sitemap::util {

/*
  Central error types.

  Two families:
    InvalidInput → the caller handed us something we refuse to encode
    SinkError    → the environment refused to persist the result

  The CLI maps each family to its own exit code.
*/

class InvalidInput : public std::runtime_error {
 public:
  InvalidInput(const std::string& msg, validation::ValidationRule rule, std::size_t record_index = 0)
      : std::runtime_error(msg), rule_(rule), record_index_(record_index) {
  }

  validation::ValidationRule Rule() const {
    return rule_;
  }

  std::size_t RecordIndex() const {
    return record_index_;
  }

 private:
  validation::ValidationRule rule_;
  std::size_t                record_index_;
};

class UnsupportedFormat : public InvalidInput {
 public:
  explicit UnsupportedFormat(const std::string& msg) : InvalidInput(msg, validation::ValidationRule::UnsupportedFormat) {
  }
};

class SinkError : public std::runtime_error {
 public:
  explicit SinkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DirectoryCreationError : public SinkError {
 public:
  explicit DirectoryCreationError(const std::string& msg) : SinkError(msg) {
  }
};

class DirectoryNotWritable : public SinkError {
 public:
  explicit DirectoryNotWritable(const std::string& msg) : SinkError(msg) {
  }
};

class FileNotWritable : public SinkError {
 public:
  explicit FileNotWritable(const std::string& msg) : SinkError(msg) {
  }
};

class WriteError : public SinkError {
 public:
  explicit WriteError(const std::string& msg) : SinkError(msg) {
  }
};

} // namespace sitemap::util
