#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modelplan::util {

/*
  Central error types.

  Caller contract violations, graph integrity failures and malformed
  serialized input each get their own type so callers can tell a bad
  request apart from a bad graph.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failure inside the crypto library, not caused by the input.
class DigestError : public std::runtime_error {
 public:
  explicit DigestError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleError : public std::runtime_error {
 public:
  CycleError(const std::string& msg, std::vector<std::string> nodes)
      : std::runtime_error(msg), nodes_(std::move(nodes)) {
  }

  // Nodes that could not be ordered, sorted.
  const std::vector<std::string>& nodes() const {
    return nodes_;
  }

 private:
  std::vector<std::string> nodes_;
};

class GraphIntegrityError : public std::runtime_error {
 public:
  GraphIntegrityError(const std::string& msg, std::string model_name, std::uint32_t max_depth)
      : std::runtime_error(msg), model_name_(std::move(model_name)), max_depth_(max_depth) {
  }

  const std::string& model_name() const {
    return model_name_;
  }

  std::uint32_t max_depth() const {
    return max_depth_;
  }

 private:
  std::string   model_name_;
  std::uint32_t max_depth_;
};

} // namespace modelplan::util
