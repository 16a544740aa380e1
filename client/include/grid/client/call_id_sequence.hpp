#ifndef GRID_CLIENT_CALL_ID_SEQUENCE_HPP
#define GRID_CLIENT_CALL_ID_SEQUENCE_HPP

#include <grid/client/config.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace grid::client {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Issues correlation ids and bounds the number of requests in flight.
  ///
  /// Every id obtained with next() or renew() must be released with complete()
  /// exactly once. Implementations are shared by all invocations of a client
  /// and are safe to call concurrently.
  ////////////////////////////////////////////////////////////////////////////////
  class CallIdSequence {
  public:
    virtual ~CallIdSequence() = default;

    // Non-positive when the sequence does not apply admission control.
    virtual int max_concurrent_invocations() const = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Acquires a new id, subject to admission control.
    ///
    /// @return new correlation id
    /// @throws OverloadError when the budget is exhausted
    ////////////////////////////////////////////////////////////////////////////////
    virtual int64_t next() = 0;

    // Acquires a new id without checking the budget. Used by urgent traffic.
    virtual int64_t renew() = 0;

    virtual void complete() = 0;

    virtual int64_t last_call_id() const = 0;

    virtual int64_t concurrent_invocations() const = 0;
  };

  class AbstractCallIdSequence : public CallIdSequence {
  public:
    AbstractCallIdSequence(int max_concurrent_invocations);

    int max_concurrent_invocations() const override;

    int64_t next() override;

    int64_t renew() override;

    void complete() override;

    int64_t last_call_id() const override;

    int64_t concurrent_invocations() const override;

  protected:
    // Called when no slot was available; either returns the acquired id or throws.
    virtual int64_t handle_no_space_left() = 0;

    // Reserves a slot when one is available.
    bool try_acquire(int64_t& id);

    int _max_concurrent_invocations;

    std::atomic<int64_t> _head{0};
    std::atomic<int64_t> _tail{0};
  };

  class CallIdSequenceWithoutBackpressure : public AbstractCallIdSequence {
  public:
    CallIdSequenceWithoutBackpressure() : AbstractCallIdSequence(0) {}

  protected:
    int64_t handle_no_space_left() override;
  };

  class FailFastCallIdSequence : public AbstractCallIdSequence {
  public:
    FailFastCallIdSequence(int max_concurrent_invocations);

  protected:
    int64_t handle_no_space_left() override;
  };

  // Waits for a free slot with an exponentially growing idle period.
  class CallIdSequenceWithBackpressure : public AbstractCallIdSequence {
  public:
    static constexpr std::chrono::microseconds MIN_PARK{1};
    static constexpr std::chrono::microseconds MAX_PARK{1000};

    CallIdSequenceWithBackpressure(
        int max_concurrent_invocations, std::chrono::milliseconds backoff_timeout
    );

  protected:
    int64_t handle_no_space_left() override;

  private:
    std::chrono::milliseconds _backoff_timeout;
  };

  struct CallIdFactory {

    static std::unique_ptr<CallIdSequence> create(const config::Invocation& cfg);
  };

} // namespace grid::client

#endif
