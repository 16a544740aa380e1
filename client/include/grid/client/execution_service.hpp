#ifndef GRID_CLIENT_EXECUTION_SERVICE_HPP
#define GRID_CLIENT_EXECUTION_SERVICE_HPP

#include <grid/client/config.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <BS_thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace grid::client {

  class Executor {
  public:
    virtual ~Executor() = default;

    // Throws RejectedExecutionError when the executor no longer accepts tasks.
    virtual void execute(std::function<void()> task) = 0;
  };

  class Scheduler {
  public:
    virtual ~Scheduler() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs the task once after the delay.
    ///
    /// @param[in] task work to execute on a scheduler-owned thread
    /// @param[in] delay minimal time before the task starts
    /// @throws RejectedExecutionError if the scheduler is saturated or shut down
    ////////////////////////////////////////////////////////////////////////////////
    virtual void schedule(std::function<void()> task, std::chrono::milliseconds delay) = 0;
  };

  class ThreadPoolExecutor : public Executor {
  public:
    ThreadPoolExecutor(int threads, std::string name);

    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    void execute(std::function<void()> task) override;

    // Stops accepting tasks and waits for the queued ones.
    void shutdown();

  private:
    std::string _name;

    std::atomic<bool> _shutdown{false};

    BS::thread_pool _pool;

    std::shared_ptr<spdlog::logger> _logger;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Delayed and periodic task execution for the client.
  ///
  /// A single timer thread keeps tasks ordered by their due time and hands
  /// them to the internal thread pool. Continuations of user futures run on
  /// a separate user executor so that slow callbacks cannot delay retries.
  ////////////////////////////////////////////////////////////////////////////////
  class ExecutionService : public Scheduler {
  public:
    ExecutionService(const config::Executors& cfg);

    ~ExecutionService() override;

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService(ExecutionService&&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;
    ExecutionService& operator=(ExecutionService&&) = delete;

    void schedule(std::function<void()> task, std::chrono::milliseconds delay) override;

    void schedule_with_repetition(
        std::function<void()> task, std::chrono::milliseconds initial_delay,
        std::chrono::milliseconds period
    );

    void execute(std::function<void()> task);

    Executor& user_executor();

    size_t scheduled_tasks() const;

    // Pending one-shot tasks run immediately, repeated tasks are cancelled.
    // Must not be called from a pool thread.
    void shutdown();

    bool is_shutdown() const;

  private:
    struct ScheduledTask {
      std::function<void()> task;
      std::chrono::milliseconds period;
    };

    void _add(std::function<void()> task, std::chrono::milliseconds delay,
              std::chrono::milliseconds period);

    void _poll();

    int _max_scheduled_tasks;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _ending{false};

    // Equal due times keep insertion order.
    std::multimap<std::chrono::steady_clock::time_point, ScheduledTask> _tasks;

    ThreadPoolExecutor _internal;
    ThreadPoolExecutor _user;

    std::shared_ptr<spdlog::logger> _logger;

    std::thread _timer;
  };

} // namespace grid::client

#endif
