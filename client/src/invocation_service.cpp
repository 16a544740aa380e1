#include <grid/client/invocation_service.hpp>

#include <grid/client/errors.hpp>
#include <grid/client/invocation.hpp>
#include <grid/client/invocation_registry.hpp>
#include <grid/common/util.hpp>

#include <fmt/core.h>

namespace grid::client {

  InvocationServiceSupport::InvocationServiceSupport(InvocationRegistry& registry)
      : _registry(registry)
  {
    _logger = common::util::create_logger("InvocationService");
  }

  void InvocationServiceSupport::invoke_on_connection(
      const std::shared_ptr<Invocation>& invocation, const ConnectionPtr& connection
  )
  {
    send(invocation, connection);
  }

  void InvocationServiceSupport::shutdown()
  {
    _shutdown = true;
  }

  bool InvocationServiceSupport::is_shutdown() const
  {
    return _shutdown;
  }

  void InvocationServiceSupport::send(
      const std::shared_ptr<Invocation>& invocation, const ConnectionPtr& connection
  )
  {
    if (_shutdown) {
      throw ClientNotActiveError("Client is shut down");
    }

    const ClientMessagePtr& message = invocation->message();
    int64_t correlation_id = message->correlation_id();

    _registry.register_invocation(invocation);

    // Events may follow the response immediately.
    if (invocation->event_handler()) {
      connection->add_event_handler(correlation_id, invocation->event_handler());
    }

    if (!_is_allowed_to_send(*connection, *invocation) || !connection->write(message)) {

      if (invocation->event_handler()) {
        connection->remove_event_handler(correlation_id);
      }

      if (_registry.deregister(correlation_id)) {
        throw IOError(fmt::format("Message not sent to {}", connection->endpoint().to_string()));
      }

      // A response or a cleanup already claimed the invocation.
      _logger->debug(
          "Invocation {} was deregistered before its failed write was reported", correlation_id
      );
      return;
    }

    invocation->set_send_connection(connection);
  }

  bool InvocationServiceSupport::_is_allowed_to_send(
      const Connection& connection, const Invocation& invocation
  ) const
  {
    if (connection.is_heartbeating()) {
      return true;
    }

    if (invocation.bypass_heartbeat_check()) {
      return true;
    }

    _logger->debug(
        "Connection to {} is not heartbeating, invocation {} is not sent",
        connection.endpoint().to_string(), invocation.correlation_id()
    );
    return false;
  }

  SmartInvocationService::SmartInvocationService(
      InvocationRegistry& registry, const PartitionTable& partitions, const ClusterView& cluster,
      ConnectionManager& connections, LoadBalancer& load_balancer
  )
      : InvocationServiceSupport(registry), _partitions(partitions), _cluster(cluster),
        _connections(connections), _load_balancer(load_balancer)
  {
  }

  void SmartInvocationService::invoke_on_partition_owner(
      const std::shared_ptr<Invocation>& invocation, int32_t partition_id
  )
  {
    auto owner = _partitions.partition_owner(partition_id);
    if (!owner.has_value()) {
      throw IOError(fmt::format("Partition {} does not have an owner", partition_id));
    }

    invoke_on_target(invocation, owner.value());
  }

  void SmartInvocationService::invoke_on_target(
      const std::shared_ptr<Invocation>& invocation, const Address& target
  )
  {
    if (!_cluster.is_member(target)) {
      throw TargetNotMemberError(
          fmt::format("Target {} is not a member of the cluster", target.to_string())
      );
    }

    send(invocation, _connections.get_or_connect(target));
  }

  void SmartInvocationService::invoke_on_random_target(const std::shared_ptr<Invocation>& invocation)
  {
    auto target = _load_balancer.next();
    if (!target.has_value()) {
      throw IOError("No address found to invoke");
    }

    send(invocation, _connections.get_or_connect(target.value()));
  }

} // namespace grid::client
