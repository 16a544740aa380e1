#include <grid/client/invocation_registry.hpp>

#include <grid/client/errors.hpp>
#include <grid/client/execution_service.hpp>
#include <grid/client/invocation.hpp>
#include <grid/common/exceptions.hpp>
#include <grid/common/util.hpp>

#include <mutex>
#include <vector>

#include <fmt/core.h>

namespace grid::client {

  InvocationRegistry::InvocationRegistry()
  {
    _logger = common::util::create_logger("InvocationRegistry");
  }

  void InvocationRegistry::register_invocation(const std::shared_ptr<Invocation>& invocation)
  {
    int64_t correlation_id = invocation->message()->correlation_id();

    std::shared_lock<std::shared_mutex> lock{_traversal_mutex};
    rw_acc_t acc;
    if (!_invocations.insert(acc, correlation_id)) {
      throw common::ObjectExists(
          fmt::format("Invocation with correlation id {} is already registered", correlation_id)
      );
    }
    acc->second = invocation;
  }

  std::shared_ptr<Invocation> InvocationRegistry::deregister(int64_t correlation_id)
  {
    std::shared_lock<std::shared_mutex> lock{_traversal_mutex};
    rw_acc_t acc;
    if (!_invocations.find(acc, correlation_id)) {
      return nullptr;
    }

    auto invocation = std::move(acc->second);
    _invocations.erase(acc);
    return invocation;
  }

  bool InvocationRegistry::handle_response(
      int64_t correlation_id, const ClientMessagePtr& response
  )
  {
    if (!response) {
      throw common::InvalidArgumentError(
          fmt::format("Null response for invocation {}", correlation_id)
      );
    }

    auto invocation = deregister(correlation_id);
    if (!invocation) {
      _logger->debug("Dropping response of unknown invocation {}", correlation_id);
      return false;
    }

    invocation->notify(response);
    return true;
  }

  bool InvocationRegistry::handle_exception(int64_t correlation_id, std::exception_ptr error)
  {
    auto invocation = deregister(correlation_id);
    if (!invocation) {
      _logger->debug(
          "Dropping failure of unknown invocation {}: {}", correlation_id, describe(error)
      );
      return false;
    }

    invocation->notify_exception(std::move(error));
    return true;
  }

  size_t InvocationRegistry::clean_resources()
  {
    auto now = std::chrono::steady_clock::now();

    std::vector<int64_t> expired;
    std::vector<std::pair<int64_t, std::string>> disconnected;
    {
      std::unique_lock<std::shared_mutex> lock{_traversal_mutex};
      for (auto& [correlation_id, invocation] : _invocations) {

        if (now > invocation->deadline()) {
          expired.push_back(correlation_id);
          continue;
        }

        auto connection = invocation->send_connection();
        if (connection && !connection->is_alive()) {
          disconnected.emplace_back(correlation_id, connection->endpoint().to_string());
        }
      }
    }

    size_t notified = 0;
    for (int64_t id : expired) {
      notified += handle_exception(
          id, std::make_exception_ptr(OperationTimeoutError(
                  fmt::format("Invocation {} did not receive a response before its deadline", id)
              ))
      );
    }

    for (auto& [id, endpoint] : disconnected) {
      notified += handle_exception(
          id, std::make_exception_ptr(TargetDisconnectedError(
                  fmt::format("Disconnected from {} while waiting for invocation {}", endpoint, id)
              ))
      );
    }

    if (notified > 0) {
      _logger->debug(
          "Cleaned up {} invocations, {} expired, {} disconnected", notified, expired.size(),
          disconnected.size()
      );
    }
    return notified;
  }

  size_t InvocationRegistry::connection_closed(const ConnectionPtr& connection)
  {
    std::vector<int64_t> affected;
    {
      std::unique_lock<std::shared_mutex> lock{_traversal_mutex};
      for (auto& [correlation_id, invocation] : _invocations) {
        if (invocation->send_connection() == connection) {
          affected.push_back(correlation_id);
        }
      }
    }

    size_t notified = 0;
    std::string endpoint = connection->endpoint().to_string();
    for (int64_t id : affected) {
      notified += handle_exception(
          id, std::make_exception_ptr(TargetDisconnectedError(
                  fmt::format("Connection to {} closed while waiting for invocation {}", endpoint, id)
              ))
      );
    }

    _logger->info("Connection to {} closed, failed {} invocations", endpoint, notified);
    return notified;
  }

  size_t InvocationRegistry::shutdown()
  {
    std::vector<int64_t> pending;
    {
      std::unique_lock<std::shared_mutex> lock{_traversal_mutex};
      for (auto& [correlation_id, invocation] : _invocations) {
        pending.push_back(correlation_id);
      }
    }

    size_t notified = 0;
    for (int64_t id : pending) {
      notified += handle_exception(
          id, std::make_exception_ptr(ClientNotActiveError(
                  fmt::format("Client is shut down, invocation {} abandoned", id)
              ))
      );
    }

    if (notified > 0) {
      _logger->info("Failed {} pending invocations on shutdown", notified);
    }
    return notified;
  }

  void InvocationRegistry::start_housekeeping(
      ExecutionService& service, std::chrono::milliseconds period
  )
  {
    service.schedule_with_repetition([this]() { clean_resources(); }, period, period);
  }

  size_t InvocationRegistry::size() const
  {
    std::shared_lock<std::shared_mutex> lock{_traversal_mutex};
    return _invocations.size();
  }

} // namespace grid::client
