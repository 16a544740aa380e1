#ifndef GRID_CLIENT_FUTURE_HPP
#define GRID_CLIENT_FUTURE_HPP

#include <grid/client/message.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace grid::client {

  class Executor;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Result of an invocation, completed exactly once.
  ///
  /// The first call to complete() decides the outcome: either the response or
  /// the error. Later calls return false and leave the state untouched, which
  /// resolves the race between a late response and a locally detected failure.
  ///
  /// Callbacks are handed to an executor, the user executor of the client
  /// unless another one is given, and never run under the internal lock.
  ////////////////////////////////////////////////////////////////////////////////
  class InvocationFuture {
  public:
    // Exactly one of the arguments is set.
    using callback_t = std::function<void(const ClientMessagePtr&, const std::exception_ptr&)>;

    InvocationFuture(Executor& default_executor) : _default_executor(default_executor) {}

    InvocationFuture(const InvocationFuture&) = delete;
    InvocationFuture& operator=(const InvocationFuture&) = delete;

    bool complete(ClientMessagePtr response);

    bool complete(std::exception_ptr error);

    bool is_done() const;

    bool is_completed_exceptionally() const;

    // Blocks until completion. Rethrows the stored error.
    ClientMessagePtr get();

    // Throws TimeoutError if not completed within the timeout.
    ClientMessagePtr get(std::chrono::milliseconds timeout);

    bool wait_for(std::chrono::milliseconds timeout) const;

    void and_then(callback_t callback);

    void and_then(callback_t callback, Executor& executor);

  private:
    enum class State {

      PENDING = 0,
      RESPONSE,
      ERROR

    };

    bool _complete(ClientMessagePtr response, std::exception_ptr error);

    ClientMessagePtr _result() const;

    void _dispatch(callback_t callback, Executor& executor) const;

    Executor& _default_executor;

    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;

    State _state{State::PENDING};
    ClientMessagePtr _response;
    std::exception_ptr _error;

    std::vector<std::pair<callback_t, Executor*>> _callbacks;
  };

  using InvocationFuturePtr = std::shared_ptr<InvocationFuture>;

} // namespace grid::client

#endif
