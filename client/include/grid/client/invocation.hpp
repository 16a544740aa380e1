#ifndef GRID_CLIENT_INVOCATION_HPP
#define GRID_CLIENT_INVOCATION_HPP

#include <grid/client/binding.hpp>
#include <grid/client/config.hpp>
#include <grid/client/connection.hpp>
#include <grid/client/errors.hpp>
#include <grid/client/future.hpp>
#include <grid/client/message.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>

namespace grid::client {

  class CallIdSequence;
  class Executor;
  class InvocationService;
  class LifecycleService;
  class Scheduler;

  // Collaborators shared by all invocations of a client.
  struct InvocationContext {
    LifecycleService& lifecycle;
    InvocationService& invocation_service;
    CallIdSequence& call_id_sequence;
    Scheduler& scheduler;
    Executor& user_executor;
    client::config::Invocation config;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief A single logical request and its retries.
  ///
  /// Each attempt acquires a correlation id, routes the message according to
  /// the binding and waits for notify() or notify_exception() from the response
  /// dispatcher. Failures are either retried after a fixed wait or complete the
  /// future. The deadline is computed once at construction and bounds the
  /// total time of all attempts.
  ///
  /// Invocations are always owned by a std::shared_ptr: a pending retry and the
  /// invocation registry both keep the invocation alive.
  ////////////////////////////////////////////////////////////////////////////////
  class Invocation : public std::enable_shared_from_this<Invocation> {
  public:
    static std::shared_ptr<Invocation> create(
        InvocationContext& context, ClientMessagePtr message,
        client::binding::Binding binding = client::binding::Random{}
    );

    Invocation(const Invocation&) = delete;
    Invocation& operator=(const Invocation&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Starts an attempt: acquires a correlation id and routes the message.
    ///
    /// Synchronous routing failures are handled as if they were reported by
    /// notify_exception().
    ///
    /// @return future of this invocation
    /// @throws OverloadError when admission control rejects the request
    ////////////////////////////////////////////////////////////////////////////////
    InvocationFuturePtr invoke();

    // Same as invoke() but acquires the id outside of the admission budget.
    InvocationFuturePtr invoke_urgent();

    // Retry entry point, executed by the scheduler. Never throws.
    void run();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Completes the invocation with a response.
    ///
    /// A response arriving after the invocation already completed is ignored.
    ///
    /// @throws common::InvalidArgumentError if the response is null
    ////////////////////////////////////////////////////////////////////////////////
    void notify(const ClientMessagePtr& response);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Handles a failure of the current attempt.
    ///
    /// Decision order:
    /// (1) client not running: complete with ClientNotActiveError wrapping the cause,
    /// (2) transport failure on a bound connection: complete with the failure,
    /// (3) deadline passed: complete with the failure,
    /// (4) retry-safe failure, redo enabled, or a disconnect of a retryable
    ///     message: schedule a retry; if the scheduler rejects it, complete with
    ///     the original failure,
    /// (5) otherwise complete with the failure.
    ///
    /// Ignored if the invocation already completed.
    ////////////////////////////////////////////////////////////////////////////////
    void notify_exception(std::exception_ptr exception);

    // Blocks until the current attempt is sent or the invocation completes.
    // Returns nullptr if it completed before a connection was bound.
    ConnectionPtr send_connection_or_wait();

    ConnectionPtr send_connection() const;

    // Called by the router once the message was written. Returns false if this
    // attempt already has a connection.
    bool set_send_connection(ConnectionPtr connection);

    int32_t partition_id() const;

    const ClientMessagePtr& message() const;

    const client::binding::Binding& binding() const;

    bool is_bound_to_single_connection() const;

    // The handler survives retries. Set it before the first invoke().
    const EventHandlerPtr& event_handler() const;

    void set_event_handler(EventHandlerPtr handler);

    bool bypass_heartbeat_check() const;

    void set_bypass_heartbeat_check(bool bypass);

    bool is_urgent() const;

    int64_t correlation_id() const;

    std::chrono::steady_clock::time_point deadline() const;

    Executor& user_executor() const;

    const InvocationFuturePtr& future() const;

  private:
    Invocation(InvocationContext& context, ClientMessagePtr message, client::binding::Binding binding);

    void _invoke_on_selection();

    bool _should_retry(ErrorCategory category) const;

    void _schedule_retry(const std::exception_ptr& cause);

    void _complete(ClientMessagePtr response);

    void _complete(std::exception_ptr error);

    void _release_call_id();

    void _wake_waiters();

    InvocationContext& _context;

    ClientMessagePtr _message;

    const client::binding::Binding _binding;

    const std::chrono::steady_clock::time_point _deadline;

    std::atomic<bool> _urgent{false};

    bool _bypass_heartbeat_check{false};

    std::atomic<int64_t> _correlation_id{ClientMessage::UNASSIGNED_CORRELATION_ID};

    // True between acquiring an id and releasing it.
    std::atomic<bool> _holds_call_id{false};

    EventHandlerPtr _event_handler;

    mutable std::mutex _send_mutex;
    std::condition_variable _send_cv;
    ConnectionPtr _send_connection;

    InvocationFuturePtr _future;
  };

  using InvocationPtr = std::shared_ptr<Invocation>;

} // namespace grid::client

#endif
