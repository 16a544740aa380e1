#ifndef GRID_CLIENT_ERRORS_HPP
#define GRID_CLIENT_ERRORS_HPP

#include <grid/common/exceptions.hpp>

#include <exception>
#include <string>
#include <string_view>

namespace grid::client {

  // Admission control rejected a new correlation id.
  struct OverloadError : common::GridException {

    OverloadError(const std::string& msg) : common::GridException(msg) {}
  };

  // Transport failure: a write was not accepted, no route to a member.
  struct IOError : common::GridException {

    IOError(const std::string& msg) : common::GridException(msg) {}
  };

  // The target member is shutting down or not yet started.
  struct InstanceNotActiveError : common::GridException {

    InstanceNotActiveError(const std::string& msg) : common::GridException(msg) {}
  };

  // Base of failures that can be resent safely.
  struct RetryableError : common::GridException {

    RetryableError(const std::string& msg) : common::GridException(msg) {}
  };

  struct TargetNotMemberError : RetryableError {

    TargetNotMemberError(const std::string& msg) : RetryableError(msg) {}
  };

  // The connection carrying the request was lost before a response arrived.
  // The request may or may not have been executed.
  struct TargetDisconnectedError : common::GridException {

    TargetDisconnectedError(const std::string& msg) : common::GridException(msg) {}
  };

  struct ClientNotActiveError : common::GridException {

    ClientNotActiveError(const std::string& msg, std::exception_ptr cause = nullptr)
        : common::GridException(msg), _cause(std::move(cause))
    {
    }

    const std::exception_ptr& cause() const
    {
      return _cause;
    }

  private:
    std::exception_ptr _cause;
  };

  struct RejectedExecutionError : common::GridException {

    RejectedExecutionError(const std::string& msg) : common::GridException(msg) {}
  };

  // Invocation exceeded its deadline without receiving a response.
  struct OperationTimeoutError : common::GridException {

    OperationTimeoutError(const std::string& msg) : common::GridException(msg) {}
  };

  // Blocking wait on a future expired.
  struct TimeoutError : common::GridException {

    TimeoutError(const std::string& msg) : common::GridException(msg) {}
  };

  enum class ErrorCategory {

    OVERLOAD = 0,
    TRANSPORT,
    TARGET_NOT_ACTIVE,
    RETRYABLE,
    TARGET_DISCONNECTED,
    CLIENT_NOT_ACTIVE,
    SCHEDULING_REJECTED,
    OTHER

  };

  ErrorCategory classify(const std::exception_ptr& error);

  // Failures that can be retried regardless of the request.
  bool is_retry_safe(ErrorCategory category);

  std::string_view to_string(ErrorCategory category);

  // Message of the stored exception, for logs and wrapping.
  std::string describe(const std::exception_ptr& error);

} // namespace grid::client

#endif
