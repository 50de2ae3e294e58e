#pragma once

#include <stdexcept>
#include <string>

namespace fieldwake::util {

/*
  Engine error types. grpc::ToStatus maps each one to a status code; the
  ingest path turns MalformedMessage into a DISCARDED delivery instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A wake was asked to move along an edge the protocol table does not have.
class IllegalTransition : public InvalidState {
 public:
  explicit IllegalTransition(const std::string& msg) : InvalidState(msg) {
  }
};

// Device input that cannot be classified or parsed. Never retried server-side.
class MalformedMessage : public std::runtime_error {
 public:
  explicit MalformedMessage(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A backend that may recover on its own: a busy database, an unreachable
// bucket. The transfer is failed and the device retries on a later wake.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fieldwake::util
