#pragma once

#include <stdexcept>
#include <string>

namespace prdchat::util {

/*
  Central error types.

  Transport adapters translate these to gRPC status codes; the chat
  pipeline translates them to terminal error events.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SessionNotFound : public NotFound {
 public:
  explicit SessionNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class DocumentNotFound : public NotFound {
 public:
  explicit DocumentNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A pipeline step was requested from a stage that cannot perform it.
class InvalidStage : public std::runtime_error {
 public:
  explicit InvalidStage(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LlmError : public std::runtime_error {
 public:
  explicit LlmError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace prdchat::util
