#include <grid/client/lifecycle.hpp>

#include <spdlog/spdlog.h>

namespace grid::client {

  bool ClientLifecycle::is_running() const
  {
    return _state.load() == State::STARTED;
  }

  void ClientLifecycle::start()
  {
    State expected = State::STARTING;
    if (!_state.compare_exchange_strong(expected, State::STARTED)) {
      spdlog::warn("Cannot start the client in state {}", to_string(expected));
      return;
    }
    spdlog::info("Client started");
  }

  bool ClientLifecycle::begin_shutdown()
  {
    State current = _state.load();
    while (current == State::STARTING || current == State::STARTED) {
      if (_state.compare_exchange_weak(current, State::SHUTTING_DOWN)) {
        spdlog::info("Client is shutting down");
        return true;
      }
    }
    return false;
  }

  void ClientLifecycle::finish_shutdown()
  {
    _state = State::SHUTDOWN;
    spdlog::info("Client is shut down");
  }

  ClientLifecycle::State ClientLifecycle::state() const
  {
    return _state.load();
  }

  std::string_view ClientLifecycle::to_string(State state)
  {
    switch (state) {
    case State::STARTING:
      return "STARTING";
    case State::STARTED:
      return "STARTED";
    case State::SHUTTING_DOWN:
      return "SHUTTING_DOWN";
    case State::SHUTDOWN:
      return "SHUTDOWN";
    }
    return "UNKNOWN";
  }

} // namespace grid::client
