#include <grid/client/execution_service.hpp>

#include <grid/client/errors.hpp>
#include <grid/common/util.hpp>

#include <fmt/core.h>

namespace grid::client {

  ThreadPoolExecutor::ThreadPoolExecutor(int threads, std::string name)
      : _name(std::move(name)), _pool(threads)
  {
    _logger = common::util::create_logger(_name);
  }

  ThreadPoolExecutor::~ThreadPoolExecutor()
  {
    shutdown();
  }

  void ThreadPoolExecutor::execute(std::function<void()> task)
  {
    if (_shutdown) {
      throw RejectedExecutionError(fmt::format("Executor {} is shut down", _name));
    }

    _pool.detach_task([this, task = std::move(task)]() {
      try {
        task();
      } catch (std::exception& exc) {
        _logger->error("Task failed with an exception: {}", exc.what());
      } catch (...) {
        _logger->error("Task failed with an unknown exception");
      }
    });
  }

  void ThreadPoolExecutor::shutdown()
  {
    _shutdown = true;
    _pool.wait();
  }

  ExecutionService::ExecutionService(const config::Executors& cfg)
      : _max_scheduled_tasks(cfg.max_scheduled_tasks),
        _internal(cfg.internal_threads, "internal-executor"),
        _user(cfg.user_threads, "user-executor")
  {
    _logger = common::util::create_logger("ExecutionService");
    _timer = std::thread(&ExecutionService::_poll, this);
  }

  ExecutionService::~ExecutionService()
  {
    shutdown();
  }

  void ExecutionService::schedule(std::function<void()> task, std::chrono::milliseconds delay)
  {
    _add(std::move(task), delay, std::chrono::milliseconds{0});
  }

  void ExecutionService::schedule_with_repetition(
      std::function<void()> task, std::chrono::milliseconds initial_delay,
      std::chrono::milliseconds period
  )
  {
    if (period.count() <= 0) {
      throw common::InvalidArgumentError(
          fmt::format("Period of a repeated task must be positive, got {} ms", period.count())
      );
    }
    _add(std::move(task), initial_delay, period);
  }

  void ExecutionService::execute(std::function<void()> task)
  {
    _internal.execute(std::move(task));
  }

  Executor& ExecutionService::user_executor()
  {
    return _user;
  }

  size_t ExecutionService::scheduled_tasks() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    return _tasks.size();
  }

  bool ExecutionService::is_shutdown() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    return _ending;
  }

  void ExecutionService::shutdown()
  {
    std::vector<std::function<void()>> pending;
    {
      std::unique_lock<std::mutex> lock{_mutex};
      if (_ending) {
        return;
      }
      _ending = true;

      for (auto& [due, entry] : _tasks) {
        if (entry.period.count() == 0) {
          pending.emplace_back(std::move(entry.task));
        }
      }
      if (!_tasks.empty()) {
        _logger->debug(
            "Running {} pending tasks and cancelling {} repeated tasks on shutdown",
            pending.size(), _tasks.size() - pending.size()
        );
      }
      _tasks.clear();
    }
    _cv.notify_all();

    if (_timer.joinable()) {
      _timer.join();
    }

    // A pending retry must still complete its future.
    for (auto& task : pending) {
      try {
        _internal.execute(std::move(task));
      } catch (RejectedExecutionError& exc) {
        _logger->warn("Could not run a pending task: {}", exc.what());
      }
    }

    _internal.shutdown();
    _user.shutdown();
  }

  void ExecutionService::_add(
      std::function<void()> task, std::chrono::milliseconds delay,
      std::chrono::milliseconds period
  )
  {
    {
      std::unique_lock<std::mutex> lock{_mutex};

      if (_ending) {
        throw RejectedExecutionError("Execution service is shut down");
      }

      if (_max_scheduled_tasks > 0 && _tasks.size() >= static_cast<size_t>(_max_scheduled_tasks)) {
        throw RejectedExecutionError(
            fmt::format("Scheduled task queue is full, limit {}", _max_scheduled_tasks)
        );
      }

      auto due = std::chrono::steady_clock::now() + delay;
      _tasks.emplace(due, ScheduledTask{std::move(task), period});
    }
    _cv.notify_one();
  }

  void ExecutionService::_poll()
  {
    std::unique_lock<std::mutex> lock{_mutex};

    while (!_ending) {

      if (_tasks.empty()) {
        _cv.wait(lock);
        continue;
      }

      auto due = _tasks.begin()->first;
      if (std::chrono::steady_clock::now() < due) {
        _cv.wait_until(lock, due);
        continue;
      }

      auto node = _tasks.extract(_tasks.begin());
      ScheduledTask& entry = node.mapped();

      std::function<void()> task;
      if (entry.period.count() > 0) {
        task = entry.task;
        node.key() = due + entry.period;
        _tasks.insert(std::move(node));
      } else {
        task = std::move(entry.task);
      }

      lock.unlock();

      try {
        _internal.execute(std::move(task));
      } catch (RejectedExecutionError& exc) {
        _logger->warn("Could not run a scheduled task: {}", exc.what());
      }

      lock.lock();
    }
  }

} // namespace grid::client
