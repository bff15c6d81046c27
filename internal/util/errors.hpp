#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chainweave::util {

/*
  Central error types.

  Builder errors and registry conflicts are thrown to the caller.
  Plugin faults are captured into node state by the executor and only
  surface as exceptions through RequireSuccess().
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateName : public std::runtime_error {
 public:
  explicit DuplicateName(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Chain construction
// ------------------------------------------------------------

class BuildError : public std::runtime_error {
 public:
  BuildError(const std::string& msg, std::string tag) : std::runtime_error(msg), tag_(std::move(tag)) {
  }

  // type tag the failure is about (may be empty)
  const std::string& tag() const {
    return tag_;
  }

 private:
  std::string tag_;
};

// No candidate producer for a required tag.
class NoViableChain : public BuildError {
 public:
  explicit NoViableChain(const std::string& tag) : BuildError("no viable producer for tag '" + tag + "'", tag) {
  }
};

// A tag reappeared on its own resolution path.
class CyclicDependency : public BuildError {
 public:
  CyclicDependency(const std::string& tag, std::vector<std::string> path)
      : BuildError("cyclic dependency on tag '" + tag + "'", tag), path_(std::move(path)) {
  }

  const std::vector<std::string>& path() const {
    return path_;
  }

 private:
  std::vector<std::string> path_;
};

// More than one producer resolves the same consumer input. Builder defect.
class AmbiguousFanIn : public BuildError {
 public:
  AmbiguousFanIn(const std::string& consumer, const std::string& tag)
      : BuildError("ambiguous fan-in for input '" + tag + "' of node '" + consumer + "'", tag), consumer_(consumer) {
  }

  const std::string& consumer() const {
    return consumer_;
  }

 private:
  std::string consumer_;
};

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

// Raised by plugin implementations.
class PluginError : public std::runtime_error {
 public:
  PluginError(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

// Wraps a plugin failure or timeout for a specific chain node.
class PluginExecutionError : public std::runtime_error {
 public:
  PluginExecutionError(std::string node_id, std::string code, const std::string& msg)
      : std::runtime_error(msg), node_id_(std::move(node_id)), code_(std::move(code)) {
  }

  const std::string& node_id() const {
    return node_id_;
  }
  const std::string& code() const {
    return code_;
  }

 private:
  std::string node_id_;
  std::string code_;
};

class ChainAborted : public std::runtime_error {
 public:
  explicit ChainAborted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chainweave::util
