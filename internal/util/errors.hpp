#pragma once

#include <stdexcept>
#include <string>

namespace workledger::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ledger flavour of NotFound: the account row does not exist.
class UserNotFound : public NotFound {
 public:
  explicit UserNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request failed validation (unknown job type, unknown owner, bad limits).
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidAmount : public InvalidArgument {
 public:
  explicit InvalidAmount(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InsufficientCredits : public std::runtime_error {
 public:
  InsufficientCredits(const std::string& msg, long long available, long long required)
      : std::runtime_error(msg), available_(available), required_(required) {
  }

  long long Available() const {
    return available_;
  }
  long long Required() const {
    return required_;
  }

 private:
  long long available_;
  long long required_;
};

} // namespace workledger::util
