#include <grid/client/future.hpp>

#include <grid/client/errors.hpp>
#include <grid/client/execution_service.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace grid::client {

  bool InvocationFuture::complete(ClientMessagePtr response)
  {
    return _complete(std::move(response), nullptr);
  }

  bool InvocationFuture::complete(std::exception_ptr error)
  {
    return _complete(nullptr, std::move(error));
  }

  bool InvocationFuture::_complete(ClientMessagePtr response, std::exception_ptr error)
  {
    std::vector<std::pair<callback_t, Executor*>> callbacks;
    {
      std::unique_lock<std::mutex> lock{_mutex};

      if (_state != State::PENDING) {
        return false;
      }

      if (error) {
        _state = State::ERROR;
        _error = std::move(error);
      } else {
        _state = State::RESPONSE;
        _response = std::move(response);
      }

      callbacks.swap(_callbacks);
    }
    _cv.notify_all();

    for (auto& [callback, executor] : callbacks) {
      _dispatch(std::move(callback), *executor);
    }

    return true;
  }

  bool InvocationFuture::is_done() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    return _state != State::PENDING;
  }

  bool InvocationFuture::is_completed_exceptionally() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    return _state == State::ERROR;
  }

  ClientMessagePtr InvocationFuture::get()
  {
    std::unique_lock<std::mutex> lock{_mutex};
    _cv.wait(lock, [this]() { return _state != State::PENDING; });
    return _result();
  }

  ClientMessagePtr InvocationFuture::get(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock{_mutex};
    if (!_cv.wait_for(lock, timeout, [this]() { return _state != State::PENDING; })) {
      throw TimeoutError(
          fmt::format("Invocation did not complete within {} ms", timeout.count())
      );
    }
    return _result();
  }

  bool InvocationFuture::wait_for(std::chrono::milliseconds timeout) const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    return _cv.wait_for(lock, timeout, [this]() { return _state != State::PENDING; });
  }

  // Requires the lock.
  ClientMessagePtr InvocationFuture::_result() const
  {
    if (_state == State::ERROR) {
      std::rethrow_exception(_error);
    }
    return _response;
  }

  void InvocationFuture::and_then(callback_t callback)
  {
    and_then(std::move(callback), _default_executor);
  }

  void InvocationFuture::and_then(callback_t callback, Executor& executor)
  {
    {
      std::unique_lock<std::mutex> lock{_mutex};
      if (_state == State::PENDING) {
        _callbacks.emplace_back(std::move(callback), &executor);
        return;
      }
    }

    _dispatch(std::move(callback), executor);
  }

  void InvocationFuture::_dispatch(callback_t callback, Executor& executor) const
  {
    // State is final at this point, no lock needed to read it.
    ClientMessagePtr response = _response;
    std::exception_ptr error = _error;

    try {
      executor.execute([callback = std::move(callback), response, error]() {
        callback(response, error);
      });
    } catch (RejectedExecutionError& exc) {
      spdlog::error("Could not dispatch invocation callback: {}", exc.what());
    }
  }

} // namespace grid::client
