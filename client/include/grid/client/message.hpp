#ifndef GRID_CLIENT_MESSAGE_HPP
#define GRID_CLIENT_MESSAGE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace grid::client {

  // Request or response exchanged with the cluster. The payload is opaque here:
  // encoding and decoding belong to the protocol layer. Only the header fields
  // that routing and retries depend on are exposed.
  class ClientMessage {
  public:
    static constexpr int32_t UNASSIGNED_PARTITION = -1;
    static constexpr int64_t UNASSIGNED_CORRELATION_ID = -1;

    ClientMessage(int32_t message_type, std::vector<char> payload = {}, bool retryable = false)
        : _message_type(message_type), _retryable(retryable), _payload(std::move(payload))
    {
    }

    ClientMessage(const ClientMessage&) = delete;
    ClientMessage& operator=(const ClientMessage&) = delete;

    int32_t message_type() const
    {
      return _message_type;
    }

    // Updated by every attempt, read by the writer thread.
    int64_t correlation_id() const
    {
      return _correlation_id.load();
    }

    void correlation_id(int64_t id)
    {
      _correlation_id.store(id);
    }

    int32_t partition_id() const
    {
      return _partition_id;
    }

    void partition_id(int32_t id)
    {
      _partition_id = id;
    }

    // Idempotent requests can be resent after the target disconnected.
    bool is_retryable() const
    {
      return _retryable;
    }

    void retryable(bool val)
    {
      _retryable = val;
    }

    const std::vector<char>& payload() const
    {
      return _payload;
    }

  private:
    int32_t _message_type;
    std::atomic<int64_t> _correlation_id{UNASSIGNED_CORRELATION_ID};
    int32_t _partition_id{UNASSIGNED_PARTITION};
    bool _retryable;
    std::vector<char> _payload;
  };

  using ClientMessagePtr = std::shared_ptr<ClientMessage>;

} // namespace grid::client

#endif
