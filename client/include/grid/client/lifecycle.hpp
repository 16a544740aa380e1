#ifndef GRID_CLIENT_LIFECYCLE_HPP
#define GRID_CLIENT_LIFECYCLE_HPP

#include <atomic>
#include <string_view>

namespace grid::client {

  class LifecycleService {
  public:
    virtual ~LifecycleService() = default;

    virtual bool is_running() const = 0;
  };

  class ClientLifecycle : public LifecycleService {
  public:
    enum class State {

      STARTING = 0,
      STARTED,
      SHUTTING_DOWN,
      SHUTDOWN

    };

    bool is_running() const override;

    void start();

    // Returns false if the client was already shutting down.
    bool begin_shutdown();

    void finish_shutdown();

    State state() const;

    static std::string_view to_string(State state);

  private:
    std::atomic<State> _state{State::STARTING};
  };

} // namespace grid::client

#endif
