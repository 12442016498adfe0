#pragma once

#include <stdexcept>
#include <string>

namespace logship::util {

/*
  Central error types.

  Fatal ones end processing of an envelope (or of the whole invocation
  for ConfigError); NetworkError is the only retryable kind and never
  leaves the transport.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidEntry : public std::runtime_error {
 public:
  explicit InvalidEntry(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsplittableEntry : public std::runtime_error {
 public:
  explicit UnsplittableEntry(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PayloadTooLarge : public std::runtime_error {
 public:
  explicit PayloadTooLarge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NetworkError : public std::runtime_error {
 public:
  explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Throttled : public std::runtime_error {
 public:
  explicit Throttled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetriesExhausted : public std::runtime_error {
 public:
  explicit RetriesExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace logship::util
