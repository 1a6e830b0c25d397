#pragma once

#include <stdexcept>
#include <string>

namespace routebid::util {

/*
  Central error types.

  Every domain failure surfaces as one of these. The gRPC layer maps each
  kind to a status code; callers only ever match on the type.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PackageNotBiddable : public std::runtime_error {
 public:
  explicit PackageNotBiddable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateBid : public std::runtime_error {
 public:
  explicit DuplicateBid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotOwner : public std::runtime_error {
 public:
  explicit NotOwner(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyTerminal : public std::runtime_error {
 public:
  explicit AlreadyTerminal(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CourierNotEligible : public std::runtime_error {
 public:
  explicit CourierNotEligible(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Courier still carries a package it picked up or is about to pick up.
class ActiveDeliveries : public std::runtime_error {
 public:
  explicit ActiveDeliveries(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lock could not be acquired within the retry budget. Safe to retry.
class Busy : public std::runtime_error {
 public:
  explicit Busy(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage rejected a write because a concurrent commit got there first.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace routebid::util
