#include <grid/client/call_id_sequence.hpp>

#include <grid/client/errors.hpp>
#include <grid/common/exceptions.hpp>

#include <algorithm>
#include <thread>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace grid::client {

  AbstractCallIdSequence::AbstractCallIdSequence(int max_concurrent_invocations)
      : _max_concurrent_invocations(max_concurrent_invocations)
  {
  }

  int AbstractCallIdSequence::max_concurrent_invocations() const
  {
    return _max_concurrent_invocations;
  }

  bool AbstractCallIdSequence::try_acquire(int64_t& id)
  {
    int64_t head = _head.load();
    do {
      if (_max_concurrent_invocations > 0 &&
          head - _tail.load() >= _max_concurrent_invocations) {
        return false;
      }
    } while (!_head.compare_exchange_weak(head, head + 1));

    id = head + 1;
    return true;
  }

  int64_t AbstractCallIdSequence::next()
  {
    int64_t id;
    if (try_acquire(id)) {
      return id;
    }
    return handle_no_space_left();
  }

  int64_t AbstractCallIdSequence::renew()
  {
    return ++_head;
  }

  void AbstractCallIdSequence::complete()
  {
    int64_t tail = ++_tail;
    if (tail > _head.load()) {
      spdlog::error("Released more correlation ids than acquired, tail {}", tail);
    }
  }

  int64_t AbstractCallIdSequence::last_call_id() const
  {
    return _head.load();
  }

  int64_t AbstractCallIdSequence::concurrent_invocations() const
  {
    return _head.load() - _tail.load();
  }

  int64_t CallIdSequenceWithoutBackpressure::handle_no_space_left()
  {
    // Unbounded sequence always has space.
    return renew();
  }

  FailFastCallIdSequence::FailFastCallIdSequence(int max_concurrent_invocations)
      : AbstractCallIdSequence(max_concurrent_invocations)
  {
    if (max_concurrent_invocations <= 0) {
      throw common::InvalidConfigurationError(fmt::format(
          "Maximum number of concurrent invocations must be positive, got {}",
          max_concurrent_invocations
      ));
    }
  }

  int64_t FailFastCallIdSequence::handle_no_space_left()
  {
    throw OverloadError(fmt::format(
        "Maximum invocation count is reached. max_concurrent_invocations = {}",
        _max_concurrent_invocations
    ));
  }

  CallIdSequenceWithBackpressure::CallIdSequenceWithBackpressure(
      int max_concurrent_invocations, std::chrono::milliseconds backoff_timeout
  )
      : AbstractCallIdSequence(max_concurrent_invocations), _backoff_timeout(backoff_timeout)
  {
    if (max_concurrent_invocations <= 0) {
      throw common::InvalidConfigurationError(fmt::format(
          "Maximum number of concurrent invocations must be positive, got {}",
          max_concurrent_invocations
      ));
    }
    if (backoff_timeout.count() <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Backoff timeout must be positive, got {} ms", backoff_timeout.count())
      );
    }
  }

  int64_t CallIdSequenceWithBackpressure::handle_no_space_left()
  {
    auto deadline = std::chrono::steady_clock::now() + _backoff_timeout;
    auto park = MIN_PARK;

    while (true) {

      int64_t id;
      if (try_acquire(id)) {
        return id;
      }

      if (std::chrono::steady_clock::now() >= deadline) {
        throw OverloadError(fmt::format(
            "Timed out trying to acquire another call id. max_concurrent_invocations = {}, "
            "backoff timeout = {} ms",
            _max_concurrent_invocations, _backoff_timeout.count()
        ));
      }

      std::this_thread::sleep_for(park);
      park = std::min(park * 2, MAX_PARK);
    }
  }

  std::unique_ptr<CallIdSequence> CallIdFactory::create(const config::Invocation& cfg)
  {
    if (cfg.max_concurrent_invocations <= 0) {
      return std::make_unique<CallIdSequenceWithoutBackpressure>();
    } else if (cfg.backoff_timeout_ms <= 0) {
      return std::make_unique<FailFastCallIdSequence>(cfg.max_concurrent_invocations);
    } else {
      return std::make_unique<CallIdSequenceWithBackpressure>(
          cfg.max_concurrent_invocations, std::chrono::milliseconds{cfg.backoff_timeout_ms}
      );
    }
  }

} // namespace grid::client
