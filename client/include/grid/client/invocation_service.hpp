#ifndef GRID_CLIENT_INVOCATION_SERVICE_HPP
#define GRID_CLIENT_INVOCATION_SERVICE_HPP

#include <grid/client/address.hpp>
#include <grid/client/connection.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace grid::client {

  class Invocation;
  class InvocationRegistry;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Resolves the binding of an invocation to a connection and sends it.
  ///
  /// Every method either hands the message to a connection or throws. Thrown
  /// exceptions are classified by the invocation like asynchronous failures.
  ////////////////////////////////////////////////////////////////////////////////
  class InvocationService {
  public:
    virtual ~InvocationService() = default;

    virtual void invoke_on_connection(
        const std::shared_ptr<Invocation>& invocation, const ConnectionPtr& connection
    ) = 0;

    virtual void
    invoke_on_partition_owner(const std::shared_ptr<Invocation>& invocation, int32_t partition_id) = 0;

    virtual void
    invoke_on_target(const std::shared_ptr<Invocation>& invocation, const Address& target) = 0;

    virtual void invoke_on_random_target(const std::shared_ptr<Invocation>& invocation) = 0;
  };

  // Owner of each partition, as known from the latest partition table.
  class PartitionTable {
  public:
    virtual ~PartitionTable() = default;

    virtual std::optional<Address> partition_owner(int32_t partition_id) const = 0;
  };

  class ClusterView {
  public:
    virtual ~ClusterView() = default;

    virtual bool is_member(const Address& address) const = 0;
  };

  class ConnectionManager {
  public:
    virtual ~ConnectionManager() = default;

    // Returns an open connection or throws IOError.
    virtual ConnectionPtr get_or_connect(const Address& address) = 0;
  };

  // Picks the member for requests without a routing hint.
  class LoadBalancer {
  public:
    virtual ~LoadBalancer() = default;

    virtual std::optional<Address> next() = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Common send path of the routers.
  ///
  /// Registers the invocation under its correlation id before writing, so that
  /// a response arriving immediately finds it. On a failed write the
  /// registration is removed again and the failure reported as IOError.
  ////////////////////////////////////////////////////////////////////////////////
  class InvocationServiceSupport : public InvocationService {
  public:
    InvocationServiceSupport(InvocationRegistry& registry);

    void invoke_on_connection(
        const std::shared_ptr<Invocation>& invocation, const ConnectionPtr& connection
    ) override;

    // New requests are refused with ClientNotActiveError.
    void shutdown();

    bool is_shutdown() const;

  protected:
    void send(const std::shared_ptr<Invocation>& invocation, const ConnectionPtr& connection);

    InvocationRegistry& _registry;

    std::shared_ptr<spdlog::logger> _logger;

  private:
    bool _is_allowed_to_send(const Connection& connection, const Invocation& invocation) const;

    std::atomic<bool> _shutdown{false};
  };

  // Routes to partition owners and members directly, one connection per member.
  class SmartInvocationService : public InvocationServiceSupport {
  public:
    SmartInvocationService(
        InvocationRegistry& registry, const PartitionTable& partitions, const ClusterView& cluster,
        ConnectionManager& connections, LoadBalancer& load_balancer
    );

    void invoke_on_partition_owner(
        const std::shared_ptr<Invocation>& invocation, int32_t partition_id
    ) override;

    void
    invoke_on_target(const std::shared_ptr<Invocation>& invocation, const Address& target) override;

    void invoke_on_random_target(const std::shared_ptr<Invocation>& invocation) override;

  private:
    const PartitionTable& _partitions;
    const ClusterView& _cluster;
    ConnectionManager& _connections;
    LoadBalancer& _load_balancer;
  };

} // namespace grid::client

#endif
