#pragma once
#include <stdexcept>
#include <string>

namespace raptorboost {

// Base for failures that are reported to the remote caller with a specific kind.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A digest string that is not 64 lowercase hex characters.
class InvalidDigest : public Error {
public:
  explicit InvalidDigest(const std::string &hex) : Error("invalid sha256 digest: '" + hex + "'") {}
};

// A transfer or file name that would escape its directory or is otherwise unusable.
class InvalidName : public Error {
public:
  explicit InvalidName(const std::string &name) : Error("invalid name: '" + name + "'") {}
};

// Another writer currently holds the digest. Retryable.
class WriteConflict : public Error {
public:
  explicit WriteConflict(const std::string &hex)
      : Error("digest is being written by another stream: " + hex) {}
};

// Name assignment referenced content that is not complete.
class PreconditionFailed : public Error {
public:
  using Error::Error;
};

// Malformed or out-of-order wire traffic.
class ProtocolError : public Error {
public:
  using Error::Error;
};

} // namespace raptorboost
