#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tracereplay::util {

/*
  Central error types.

  Log-access and malformed-record errors abort a replay. Referential gaps
  (records pointing at spans that never became live) are not errors at all
  and never reach this file.
*/

class ReplayFileError : public std::runtime_error {
 public:
  enum class Kind {
    kCannotOpenFile,
    kCannotReadLine,
    kCannotDeserializeRecord,
  };

  ReplayFileError(Kind kind, const std::string& msg, std::size_t line_index = 0, std::string line = {})
      : std::runtime_error(msg), kind_(kind), line_index_(line_index), line_(std::move(line)) {
  }

  Kind kind() const {
    return kind_;
  }

  // Zero-based, only meaningful for kCannotReadLine and kCannotDeserializeRecord.
  std::size_t line_index() const {
    return line_index_;
  }

  // Raw line text, only set for kCannotDeserializeRecord.
  const std::string& line() const {
    return line_;
  }

 private:
  Kind        kind_;
  std::size_t line_index_;
  std::string line_;
};

class MalformedRecord : public std::runtime_error {
 public:
  explicit MalformedRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ThreadSpawnError : public std::runtime_error {
 public:
  explicit ThreadSpawnError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Raised by Replay::Close() when one or more worker threads terminated with a
  failure. Failures are keyed by the recorded thread identity.
*/
class ReplayCloseError : public std::runtime_error {
 public:
  using Failure = std::pair<std::string, std::string>;

  explicit ReplayCloseError(std::vector<Failure> failures) : std::runtime_error(Describe(failures)), failures_(std::move(failures)) {
  }

  const std::vector<Failure>& failures() const {
    return failures_;
  }

 private:
  static std::string Describe(const std::vector<Failure>& failures) {
    std::string msg = "ReplayCloseError:";
    for (const auto& [thread_id, error] : failures) {
      msg += " - " + thread_id + ": " + error;
    }
    return msg;
  }

  std::vector<Failure> failures_;
};

} // namespace tracereplay::util
