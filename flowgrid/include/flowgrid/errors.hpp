// Exception taxonomy shared by the compiler, the execution engine and the job grid.
// Every error carries the unit it refers to (step name, node id or job id) so a
// caller can locate the failure without inspecting internal state.

#ifndef FLOWGRID_ERRORS_HPP
#define FLOWGRID_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flowgrid {

/**
 * @brief Base class of every error raised by flowgrid
 */
class FlowError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed structured literal
 */
class PayloadError : public FlowError {
 public:
  PayloadError(const std::string& message, std::size_t position)
      : FlowError(message + " at position " + std::to_string(position)), position_(position) {}

  std::size_t position() const noexcept { return position_; }

 private:
  std::size_t position_;
};

/**
 * @brief Workflow source rejected by a strict compile
 */
class ParseError : public FlowError {
 public:
  explicit ParseError(std::vector<std::string> errors)
      : FlowError(join(errors)), errors_(std::move(errors)) {}

  const std::vector<std::string>& errors() const noexcept { return errors_; }

 private:
  static std::string join(const std::vector<std::string>& errors) {
    std::string out = "parse failed";
    for (const auto& e : errors) {
      out += ": " + e;
    }
    return out;
  }

  std::vector<std::string> errors_;
};

/**
 * @brief Step body does not match its operation grammar
 */
class OperationSyntaxError : public FlowError {
 public:
  OperationSyntaxError(const std::string& step_name, const std::string& message)
      : FlowError("step '" + step_name + "': " + message), step_name_(step_name) {}

  const std::string& step_name() const noexcept { return step_name_; }

 private:
  std::string step_name_;
};

/**
 * @brief Unresolved dependency, duplicate step or cycle in the plan graph
 */
class GraphError : public FlowError {
 public:
  GraphError(const std::string& message, std::vector<std::string> nodes)
      : FlowError(message), nodes_(std::move(nodes)) {}

  const std::vector<std::string>& nodes() const noexcept { return nodes_; }

 private:
  std::vector<std::string> nodes_;
};

/**
 * @brief A plan node failed while executing
 */
class ExecutionError : public FlowError {
 public:
  ExecutionError(const std::string& node_id, const std::string& step_name, const std::string& message)
      : FlowError("node " + node_id + " failed: " + message),
        node_id_(node_id), step_name_(step_name), reason_(message) {}

  const std::string& node_id() const noexcept { return node_id_; }
  const std::string& step_name() const noexcept { return step_name_; }
  const std::string& reason() const noexcept { return reason_; }

 private:
  std::string node_id_;
  std::string step_name_;
  std::string reason_;
};

/**
 * @brief A job reached a terminal state other than SUCCEEDED
 */
class JobFailedError : public FlowError {
 public:
  JobFailedError(const std::string& job_id, const std::string& status, const std::string& job_error)
      : FlowError("job " + job_id + " ended " + status + (job_error.empty() ? "" : ": " + job_error)),
        job_id_(job_id), status_(status), job_error_(job_error) {}

  const std::string& job_id() const noexcept { return job_id_; }
  const std::string& status() const noexcept { return status_; }
  const std::string& job_error() const noexcept { return job_error_; }

 private:
  std::string job_id_;
  std::string status_;
  std::string job_error_;
};

/**
 * @brief A blocking wait gave up before the job reached a terminal state
 */
class JobTimeoutError : public FlowError {
 public:
  JobTimeoutError(const std::string& job_id, const std::string& last_status)
      : FlowError("timed out waiting for job " + job_id + " (last status " + last_status + ")"),
        job_id_(job_id), last_status_(last_status) {}

  const std::string& job_id() const noexcept { return job_id_; }
  const std::string& last_status() const noexcept { return last_status_; }

 private:
  std::string job_id_;
  std::string last_status_;
};

/**
 * @brief Invalid configuration file or value
 */
class ConfigError : public FlowError {
 public:
  using FlowError::FlowError;
};

}  // namespace flowgrid

#endif  // FLOWGRID_ERRORS_HPP
