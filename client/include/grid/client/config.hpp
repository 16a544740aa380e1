#ifndef GRID_CLIENT_CONFIG_HPP
#define GRID_CLIENT_CONFIG_HPP

#include <chrono>
#include <istream>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace grid::client::config {

  struct Invocation {

    static constexpr int DEFAULT_INVOCATION_TIMEOUT_MS = 120 * 1000;
    static constexpr int DEFAULT_RETRY_WAIT_MS = 1000;
    // Non-positive value disables admission control.
    static constexpr int DEFAULT_MAX_CONCURRENT_INVOCATIONS = -1;
    // Non-positive value rejects immediately when the budget is exhausted.
    static constexpr int DEFAULT_BACKOFF_TIMEOUT_MS = -1;

    Invocation()
    {
      set_defaults();
    }

    int invocation_timeout_ms;
    int retry_wait_ms;
    bool redo_operation;
    int max_concurrent_invocations;
    int backoff_timeout_ms;

    std::chrono::milliseconds invocation_timeout() const
    {
      return std::chrono::milliseconds{invocation_timeout_ms};
    }

    std::chrono::milliseconds retry_wait() const
    {
      return std::chrono::milliseconds{retry_wait_ms};
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Executors {

    static constexpr int DEFAULT_INTERNAL_THREADS = 2;
    static constexpr int DEFAULT_USER_THREADS = 2;

    Executors()
    {
      set_defaults();
    }

    int internal_threads;
    int user_threads;
    // Limit of delayed tasks waiting for their deadline, 0 means unbounded.
    int max_scheduled_tasks;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Housekeeping {

    static constexpr int DEFAULT_CLEANUP_INTERVAL_MS = 1000;

    Housekeeping()
    {
      set_defaults();
    }

    int cleanup_interval_ms;

    std::chrono::milliseconds cleanup_interval() const
    {
      return std::chrono::milliseconds{cleanup_interval_ms};
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Config {

    Invocation invocation;
    Executors executors;
    Housekeeping housekeeping;

    bool verbose;

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
  };

} // namespace grid::client::config

#endif
