#include <grid/client/errors.hpp>

namespace grid::client {

  ErrorCategory classify(const std::exception_ptr& error)
  {
    if (!error) {
      return ErrorCategory::OTHER;
    }

    // Derived types must be matched before their bases.
    try {
      std::rethrow_exception(error);
    } catch (const OverloadError&) {
      return ErrorCategory::OVERLOAD;
    } catch (const IOError&) {
      return ErrorCategory::TRANSPORT;
    } catch (const InstanceNotActiveError&) {
      return ErrorCategory::TARGET_NOT_ACTIVE;
    } catch (const RetryableError&) {
      return ErrorCategory::RETRYABLE;
    } catch (const TargetDisconnectedError&) {
      return ErrorCategory::TARGET_DISCONNECTED;
    } catch (const ClientNotActiveError&) {
      return ErrorCategory::CLIENT_NOT_ACTIVE;
    } catch (const RejectedExecutionError&) {
      return ErrorCategory::SCHEDULING_REJECTED;
    } catch (...) {
      return ErrorCategory::OTHER;
    }
  }

  bool is_retry_safe(ErrorCategory category)
  {
    switch (category) {
    case ErrorCategory::TRANSPORT:
    case ErrorCategory::TARGET_NOT_ACTIVE:
    case ErrorCategory::RETRYABLE:
      return true;
    default:
      return false;
    }
  }

  std::string_view to_string(ErrorCategory category)
  {
    switch (category) {
    case ErrorCategory::OVERLOAD:
      return "overload";
    case ErrorCategory::TRANSPORT:
      return "transport";
    case ErrorCategory::TARGET_NOT_ACTIVE:
      return "target_not_active";
    case ErrorCategory::RETRYABLE:
      return "retryable";
    case ErrorCategory::TARGET_DISCONNECTED:
      return "target_disconnected";
    case ErrorCategory::CLIENT_NOT_ACTIVE:
      return "client_not_active";
    case ErrorCategory::SCHEDULING_REJECTED:
      return "scheduling_rejected";
    case ErrorCategory::OTHER:
      return "other";
    }
    return "unknown";
  }

  std::string describe(const std::exception_ptr& error)
  {
    if (!error) {
      return "";
    }

    try {
      std::rethrow_exception(error);
    } catch (const std::exception& exc) {
      return exc.what();
    } catch (...) {
      return "unknown exception";
    }
  }

} // namespace grid::client
