#ifndef GRID_CLIENT_BINDING_HPP
#define GRID_CLIENT_BINDING_HPP

#include <grid/client/address.hpp>
#include <grid/client/connection.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace grid::client::binding {

  // Send on exactly this connection. Encodes a session or ordering requirement,
  // so a transport failure cannot be retried elsewhere.
  struct BoundConnection {
    ConnectionPtr connection;
  };

  struct Partition {
    int32_t partition_id;
  };

  struct Target {
    Address address;
  };

  struct Random {
  };

  // Alternatives are listed in routing priority.
  using Binding = std::variant<BoundConnection, Partition, Target, Random>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Builds a binding from the routing hints a caller has available.
  ///
  /// The strongest hint wins: a bound connection overrides a partition id,
  /// which overrides an explicit address. Without any hint the request goes to
  /// a member picked by the load balancer.
  ///
  /// @param[in] connection connection the request must use, may be null
  /// @param[in] partition_id partition of the key, or ClientMessage::UNASSIGNED_PARTITION
  /// @param[in] address explicit target member
  /// @return binding fixed for the lifetime of the invocation
  ////////////////////////////////////////////////////////////////////////////////
  Binding select(
      ConnectionPtr connection, int32_t partition_id, const std::optional<Address>& address
  );

  bool is_bound_to_single_connection(const Binding& binding);

  int32_t partition_id(const Binding& binding);

  std::string_view name(const Binding& binding);

} // namespace grid::client::binding

#endif
