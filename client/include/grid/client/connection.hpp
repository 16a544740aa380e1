#ifndef GRID_CLIENT_CONNECTION_HPP
#define GRID_CLIENT_CONNECTION_HPP

#include <grid/client/address.hpp>
#include <grid/client/message.hpp>

#include <cstdint>
#include <memory>

namespace grid::client {

  // Receives server-side events for requests that open a long-lived stream,
  // e.g., listener registrations.
  struct EventHandler {

    virtual ~EventHandler() = default;

    virtual void handle(const ClientMessagePtr& event) = 0;
  };

  using EventHandlerPtr = std::shared_ptr<EventHandler>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Physical connection to a cluster member.
  ///
  /// Socket management, framing and heartbeats are implemented by the
  /// transport layer. The dispatch layer only needs to write an encoded request
  /// and to know whether the connection can still carry traffic.
  ////////////////////////////////////////////////////////////////////////////////
  class Connection {
  public:
    virtual ~Connection() = default;

    virtual const Address& endpoint() const = 0;

    virtual bool is_alive() const = 0;

    // False when heartbeats from the member are overdue.
    virtual bool is_heartbeating() const = 0;

    // Queues the message for transmission. Returns false if the message could not be queued.
    virtual bool write(const ClientMessagePtr& message) = 0;

    virtual void add_event_handler(int64_t correlation_id, EventHandlerPtr handler) = 0;

    // No-op if no handler is attached under the id.
    virtual void remove_event_handler(int64_t correlation_id) = 0;
  };

  using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace grid::client

#endif
