#pragma once

#include <stdexcept>
#include <string>

namespace codeintel::util {

/*
  Caller-facing failures of the stores and the job coordinator.

  Absence on reads is never an error (optional / empty results).
  codeintelctl reports InvalidArgument and NotFound with exit code 1,
  anything else with exit code 2.
*/

// Unknown job id, missing audit log.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Overlapping job roots, sqlite constraint violations.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed input: empty thread id, root that is not a directory, bad config.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace codeintel::util
