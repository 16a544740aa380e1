#include <grid/client/invocation.hpp>

#include <grid/client/call_id_sequence.hpp>
#include <grid/client/execution_service.hpp>
#include <grid/client/invocation_service.hpp>
#include <grid/client/lifecycle.hpp>
#include <grid/common/exceptions.hpp>
#include <grid/common/util.hpp>

#include <spdlog/spdlog.h>

namespace grid::client {

  namespace {

    spdlog::logger& logger()
    {
      static std::shared_ptr<spdlog::logger> instance = common::util::create_logger("Invocation");
      return *instance;
    }

  } // namespace

  std::shared_ptr<Invocation> Invocation::create(
      InvocationContext& context, ClientMessagePtr message, binding::Binding binding
  )
  {
    return std::shared_ptr<Invocation>(
        new Invocation(context, std::move(message), std::move(binding))
    );
  }

  Invocation::Invocation(
      InvocationContext& context, ClientMessagePtr message, binding::Binding binding
  )
      : _context(context), _message(std::move(message)), _binding(std::move(binding)),
        _deadline(std::chrono::steady_clock::now() + context.config.invocation_timeout()),
        _future(std::make_shared<InvocationFuture>(context.user_executor))
  {
    if (!_message) {
      throw common::InvalidArgumentError("Invocation requires a message");
    }

    if (auto* ptr = std::get_if<binding::BoundConnection>(&_binding); ptr && !ptr->connection) {
      throw common::InvalidArgumentError("Invocation cannot be bound to a null connection");
    }

    int32_t partition = binding::partition_id(_binding);
    if (partition != ClientMessage::UNASSIGNED_PARTITION) {
      _message->partition_id(partition);
    }
  }

  InvocationFuturePtr Invocation::invoke()
  {
    // Admission failures go straight to the caller and are never retried.
    int64_t id = _urgent ? _context.call_id_sequence.renew() : _context.call_id_sequence.next();

    _correlation_id = id;
    _holds_call_id = true;
    _message->correlation_id(id);

    try {
      _invoke_on_selection();
    } catch (...) {
      auto error = std::current_exception();
      logger().debug(
          "Invocation {} failed to send over {}: {}", id, binding::name(_binding), describe(error)
      );
      notify_exception(error);
    }

    return _future;
  }

  InvocationFuturePtr Invocation::invoke_urgent()
  {
    _urgent = true;
    return invoke();
  }

  void Invocation::_invoke_on_selection()
  {
    auto self = shared_from_this();
    auto& service = _context.invocation_service;

    std::visit(
        common::util::overloaded{
            [&](const binding::BoundConnection& bound) {
              service.invoke_on_connection(self, bound.connection);
            },
            [&](const binding::Partition& partition) {
              service.invoke_on_partition_owner(self, partition.partition_id);
            },
            [&](const binding::Target& target) { service.invoke_on_target(self, target.address); },
            [&](const binding::Random&) { service.invoke_on_random_target(self); }},
        _binding
    );
  }

  void Invocation::run()
  {
    // Finished with the id of the previous attempt, invoke() acquires a new one.
    _release_call_id();

    if (_future->is_done()) {
      logger().debug("Skipping retry of completed invocation {}", _correlation_id.load());
      return;
    }

    {
      std::unique_lock<std::mutex> lock{_send_mutex};
      _send_connection.reset();
    }

    try {
      invoke();
    } catch (...) {
      _complete(std::current_exception());
    }
  }

  void Invocation::notify(const ClientMessagePtr& response)
  {
    if (!response) {
      throw common::InvalidArgumentError("Response cannot be null");
    }
    _complete(response);
  }

  void Invocation::notify_exception(std::exception_ptr exception)
  {
    if (_future->is_done()) {
      logger().debug(
          "Ignoring failure of completed invocation {}: {}", _correlation_id.load(),
          describe(exception)
      );
      return;
    }

    ErrorCategory category = classify(exception);

    if (!_context.lifecycle.is_running()) {
      _complete(std::make_exception_ptr(ClientNotActiveError(describe(exception), exception)));
      return;
    }

    if (is_bound_to_single_connection() && category == ErrorCategory::TRANSPORT) {
      logger().debug(
          "Invocation {} bound to a single connection failed: {}", _correlation_id.load(),
          describe(exception)
      );
      _complete(exception);
      return;
    }

    if (std::chrono::steady_clock::now() > _deadline) {
      logger().debug(
          "Invocation {} passed its deadline, failing with {}", _correlation_id.load(),
          describe(exception)
      );
      _complete(exception);
      return;
    }

    if (_should_retry(category)) {
      _schedule_retry(exception);
      return;
    }

    _complete(exception);
  }

  bool Invocation::_should_retry(ErrorCategory category) const
  {
    return is_retry_safe(category) || _context.config.redo_operation ||
           (category == ErrorCategory::TARGET_DISCONNECTED && _message->is_retryable());
  }

  void Invocation::_schedule_retry(const std::exception_ptr& cause)
  {
    auto self = shared_from_this();
    try {
      _context.scheduler.schedule([self]() { self->run(); }, _context.config.retry_wait());
      logger().debug(
          "Retrying invocation {} in {} ms, reason: {}", _correlation_id.load(),
          _context.config.retry_wait_ms, describe(cause)
      );
    } catch (RejectedExecutionError& exc) {
      logger().debug("Retry could not be scheduled: {}", exc.what());
      _complete(cause);
    }
  }

  void Invocation::_complete(ClientMessagePtr response)
  {
    _release_call_id();
    if (!_future->complete(std::move(response))) {
      logger().debug("Dropping late response of invocation {}", _correlation_id.load());
    }
    _wake_waiters();
  }

  void Invocation::_complete(std::exception_ptr error)
  {
    _release_call_id();
    if (!_future->complete(std::move(error))) {
      logger().debug("Dropping late failure of invocation {}", _correlation_id.load());
    }
    _wake_waiters();
  }

  void Invocation::_release_call_id()
  {
    if (_holds_call_id.exchange(false)) {
      _context.call_id_sequence.complete();
    }
  }

  void Invocation::_wake_waiters()
  {
    // Taking the lock orders the wakeup after a waiter's predicate check.
    { std::unique_lock<std::mutex> lock{_send_mutex}; }
    _send_cv.notify_all();
  }

  ConnectionPtr Invocation::send_connection_or_wait()
  {
    std::unique_lock<std::mutex> lock{_send_mutex};
    _send_cv.wait(lock, [this]() { return _send_connection != nullptr || _future->is_done(); });
    return _send_connection;
  }

  ConnectionPtr Invocation::send_connection() const
  {
    std::unique_lock<std::mutex> lock{_send_mutex};
    return _send_connection;
  }

  bool Invocation::set_send_connection(ConnectionPtr connection)
  {
    {
      std::unique_lock<std::mutex> lock{_send_mutex};
      if (_send_connection) {
        logger().warn(
            "Invocation {} already sent to {}", _correlation_id.load(),
            _send_connection->endpoint().to_string()
        );
        return false;
      }
      _send_connection = std::move(connection);
    }
    _send_cv.notify_all();
    return true;
  }

  int32_t Invocation::partition_id() const
  {
    return binding::partition_id(_binding);
  }

  const ClientMessagePtr& Invocation::message() const
  {
    return _message;
  }

  const binding::Binding& Invocation::binding() const
  {
    return _binding;
  }

  bool Invocation::is_bound_to_single_connection() const
  {
    return binding::is_bound_to_single_connection(_binding);
  }

  const EventHandlerPtr& Invocation::event_handler() const
  {
    return _event_handler;
  }

  void Invocation::set_event_handler(EventHandlerPtr handler)
  {
    _event_handler = std::move(handler);
  }

  bool Invocation::bypass_heartbeat_check() const
  {
    return _bypass_heartbeat_check;
  }

  void Invocation::set_bypass_heartbeat_check(bool bypass)
  {
    _bypass_heartbeat_check = bypass;
  }

  bool Invocation::is_urgent() const
  {
    return _urgent;
  }

  int64_t Invocation::correlation_id() const
  {
    return _correlation_id;
  }

  std::chrono::steady_clock::time_point Invocation::deadline() const
  {
    return _deadline;
  }

  Executor& Invocation::user_executor() const
  {
    return _context.user_executor;
  }

  const InvocationFuturePtr& Invocation::future() const
  {
    return _future;
  }

} // namespace grid::client
