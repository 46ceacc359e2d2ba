// Error taxonomy.
//
// Every failure that leaves a stage is one of these types (or the unchanged
// exception thrown by a leaf stage). Composite stages always keep the
// original exception as the cause, so the full chain can be inspected with
// cause() / root_cause().

#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stagecraft {

/// Message of an exception held in an exception_ptr. Non-std exceptions
/// yield "unknown error".
std::string describe(std::exception_ptr const& Error);

/// Follows execution_error::cause() until an exception that is not an
/// execution_error (or has no cause) is reached.
std::exception_ptr root_cause(std::exception_ptr Error);

class execution_error : public std::runtime_error {
public:
  execution_error(
    std::string Stage, std::string Message, std::exception_ptr Cause = nullptr
  );
  execution_error(
    std::string Stage, size_t StepIndex, std::exception_ptr Cause
  );

  std::string const& stage() const noexcept { return stage_; }
  std::optional<size_t> step_index() const noexcept { return stepIndex_; }
  std::exception_ptr cause() const noexcept { return cause_; }

protected:
  struct verbatim_t {};
  execution_error(
    verbatim_t, std::string Stage, std::string What, std::exception_ptr Cause
  );

private:
  std::string stage_;
  std::optional<size_t> stepIndex_;
  std::exception_ptr cause_;
};

/// Raised when independent units of one invocation fail. Lists every failure,
/// not only the first.
class aggregate_failure : public execution_error {
public:
  struct failure {
    std::string key;
    std::exception_ptr cause;
  };

  aggregate_failure(
    std::string Stage, std::vector<failure> Failures, size_t Total
  );

  std::vector<failure> const& failures() const noexcept { return failures_; }
  size_t failed_count() const noexcept { return failures_.size(); }
  size_t total_count() const noexcept { return total_; }

  /// Keys of the failed units, in the order they were reported.
  std::vector<std::string> keys() const;

  /// Throws Failures' first cancellation unchanged, if there is one. Used
  /// before reporting a failure list, so that a cancellation is never folded
  /// into an aggregate_failure.
  static void rethrow_cancellation(std::vector<failure> const& Failures);

private:
  std::vector<failure> failures_;
  size_t total_;
};

class no_matching_branch : public execution_error {
public:
  explicit no_matching_branch(std::string Stage);
};

/// True if Error holds a cancelled exception.
bool is_cancellation(std::exception_ptr const& Error);

/// Stop was requested and observed at a stage boundary. Deliberately not an
/// execution_error: composites rethrow it unwrapped.
class cancelled : public std::runtime_error {
public:
  explicit cancelled(std::string const& Where);
};

} // namespace stagecraft
