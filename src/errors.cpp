#include "stagecraft/errors.hpp"

#include <utility>

namespace stagecraft {

std::string describe(std::exception_ptr const& Error) {
  if (Error == nullptr) {
    return "no error";
  }
  try {
    std::rethrow_exception(Error);
  } catch (std::exception const& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

std::exception_ptr root_cause(std::exception_ptr Error) {
  while (Error != nullptr) {
    try {
      std::rethrow_exception(Error);
    } catch (execution_error const& e) {
      if (e.cause() == nullptr) {
        return Error;
      }
      Error = e.cause();
    } catch (...) {
      return Error;
    }
  }
  return Error;
}

namespace {
std::string with_cause(std::string Message, std::exception_ptr const& Cause) {
  if (Cause != nullptr) {
    Message += ": ";
    Message += describe(Cause);
  }
  return Message;
}

std::string aggregate_message(
  std::string const& Stage,
  std::vector<aggregate_failure::failure> const& Failures, size_t Total
) {
  std::string msg = Stage + ": " + std::to_string(Failures.size()) + "/" +
                    std::to_string(Total) + " items failed";
  for (size_t i = 0; i < Failures.size(); ++i) {
    msg += i == 0 ? " (" : "; ";
    msg += Failures[i].key;
    msg += ": ";
    msg += describe(Failures[i].cause);
  }
  if (!Failures.empty()) {
    msg += ")";
  }
  return msg;
}
} // namespace

execution_error::execution_error(
  std::string Stage, std::string Message, std::exception_ptr Cause
)
    : std::runtime_error(with_cause(Stage + ": " + Message, Cause)),
      stage_(std::move(Stage)), cause_(std::move(Cause)) {}

execution_error::execution_error(
  std::string Stage, size_t StepIndex, std::exception_ptr Cause
)
    : std::runtime_error(with_cause(
        Stage + ": execution failed at step " + std::to_string(StepIndex),
        Cause
      )),
      stage_(std::move(Stage)), stepIndex_(StepIndex),
      cause_(std::move(Cause)) {}

execution_error::execution_error(
  verbatim_t, std::string Stage, std::string What, std::exception_ptr Cause
)
    : std::runtime_error(What), stage_(std::move(Stage)),
      cause_(std::move(Cause)) {}

aggregate_failure::aggregate_failure(
  std::string Stage, std::vector<failure> Failures, size_t Total
)
    : execution_error(
        verbatim_t{}, Stage, aggregate_message(Stage, Failures, Total),
        Failures.empty() ? nullptr : Failures.front().cause
      ),
      failures_(std::move(Failures)), total_(Total) {}

std::vector<std::string> aggregate_failure::keys() const {
  std::vector<std::string> out;
  out.reserve(failures_.size());
  for (auto const& f : failures_) {
    out.push_back(f.key);
  }
  return out;
}

void aggregate_failure::rethrow_cancellation(
  std::vector<failure> const& Failures
) {
  for (auto const& f : Failures) {
    if (is_cancellation(f.cause)) {
      std::rethrow_exception(f.cause);
    }
  }
}

bool is_cancellation(std::exception_ptr const& Error) {
  if (Error == nullptr) {
    return false;
  }
  try {
    std::rethrow_exception(Error);
  } catch (cancelled const&) {
    return true;
  } catch (...) {
    return false;
  }
}

no_matching_branch::no_matching_branch(std::string Stage)
    : execution_error(
        std::move(Stage), "no matching branch found and no default branch set"
      ) {}

cancelled::cancelled(std::string const& Where)
    : std::runtime_error(Where + ": execution was cancelled") {}

} // namespace stagecraft
