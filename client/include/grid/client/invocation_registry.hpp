#ifndef GRID_CLIENT_INVOCATION_REGISTRY_HPP
#define GRID_CLIENT_INVOCATION_REGISTRY_HPP

#include <grid/client/connection.hpp>
#include <grid/client/message.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <shared_mutex>

#include <spdlog/spdlog.h>
#include <tbb/concurrent_hash_map.h>

namespace grid::client {

  class ExecutionService;
  class Invocation;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief In-flight invocations indexed by the correlation id of their current attempt.
  ///
  /// The response dispatcher removes the entry before notifying the invocation,
  /// so each attempt is completed at most once. Replies for ids that are not
  /// registered belong to attempts that already ended and are dropped.
  ////////////////////////////////////////////////////////////////////////////////
  class InvocationRegistry {
  public:
    using table_t = oneapi::tbb::concurrent_hash_map<int64_t, std::shared_ptr<Invocation>>;
    using rw_acc_t = table_t::accessor;

    InvocationRegistry();

    // Throws common::ObjectExists if the correlation id is already registered.
    void register_invocation(const std::shared_ptr<Invocation>& invocation);

    // Returns nullptr if the id is not registered.
    std::shared_ptr<Invocation> deregister(int64_t correlation_id);

    // Returns false if the response was stale and dropped.
    bool handle_response(int64_t correlation_id, const ClientMessagePtr& response);

    bool handle_exception(int64_t correlation_id, std::exception_ptr error);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Fails invocations that cannot receive a response anymore.
    ///
    /// Invocations past their deadline fail with OperationTimeoutError, those
    /// whose connection is no longer alive fail with TargetDisconnectedError.
    /// Both go through the regular failure handling of the invocation.
    ///
    /// @return number of invocations that were notified
    ////////////////////////////////////////////////////////////////////////////////
    size_t clean_resources();

    // Fails every invocation sent over the closed connection.
    size_t connection_closed(const ConnectionPtr& connection);

    // Fails every registered invocation with ClientNotActiveError.
    size_t shutdown();

    // The registry must outlive the execution service.
    void start_housekeeping(ExecutionService& service, std::chrono::milliseconds period);

    size_t size() const;

  private:
    // Registration and removal run concurrently; traversals exclude both.
    mutable std::shared_mutex _traversal_mutex;

    table_t _invocations;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace grid::client

#endif
