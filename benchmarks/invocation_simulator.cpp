#include <grid/client/call_id_sequence.hpp>
#include <grid/client/config.hpp>
#include <grid/client/errors.hpp>
#include <grid/client/execution_service.hpp>
#include <grid/client/invocation.hpp>
#include <grid/client/invocation_registry.hpp>
#include <grid/client/invocation_service.hpp>
#include <grid/client/lifecycle.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>
#include <vector>

#include <BS_thread_pool.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

using namespace grid::client;

struct SimulationOptions {
  int members;
  int partitions;
  int invocations;
  double write_failure;
  double response_failure;
  double disconnect;
  int latency_us;
  int network_threads;
  int wait_ms;
};

SimulationOptions simulation_opts(int argc, char** argv)
{
  cxxopts::Options options(
      "invocation-simulator", "Drive invocations against an in-memory cluster with injected faults."
  );
  options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>())(
      "members", "Number of cluster members.", cxxopts::value<int>()->default_value("3")
  )("partitions", "Number of partitions.", cxxopts::value<int>()->default_value("271"))(
      "invocations", "Number of invocations.", cxxopts::value<int>()->default_value("10000")
  )("write-failure", "Probability that a write is refused.",
    cxxopts::value<double>()->default_value("0.01"))(
      "response-failure", "Probability that a member replies with an error.",
      cxxopts::value<double>()->default_value("0.01")
  )("disconnect", "Probability that a member drops the request and the connection.",
    cxxopts::value<double>()->default_value("0.001"))(
      "latency", "Response latency in microseconds.", cxxopts::value<int>()->default_value("100")
  )("network-threads", "Threads delivering responses.",
    cxxopts::value<int>()->default_value("4"))(
      "wait", "Time to wait for all invocations, in milliseconds.",
      cxxopts::value<int>()->default_value("60000")
  );
  auto parsed_options = options.parse(argc, argv);

  SimulationOptions result{};
  result.members = parsed_options["members"].as<int>();
  result.partitions = parsed_options["partitions"].as<int>();
  result.invocations = parsed_options["invocations"].as<int>();
  result.write_failure = parsed_options["write-failure"].as<double>();
  result.response_failure = parsed_options["response-failure"].as<double>();
  result.disconnect = parsed_options["disconnect"].as<double>();
  result.latency_us = parsed_options["latency"].as<int>();
  result.network_threads = parsed_options["network-threads"].as<int>();
  result.wait_ms = parsed_options["wait"].as<int>();
  return result;
}

// Thread-safe source of injected faults.
class FaultInjector {
public:
  FaultInjector(const SimulationOptions& opts) : _opts(opts), _generator(std::random_device{}()) {}

  enum class Fault { NONE = 0, WRITE, RESPONSE, DISCONNECT };

  Fault on_write()
  {
    std::unique_lock<std::mutex> lock{_mutex};
    if (_roll() < _opts.write_failure) {
      return Fault::WRITE;
    }
    return Fault::NONE;
  }

  Fault on_response()
  {
    std::unique_lock<std::mutex> lock{_mutex};
    double val = _roll();
    if (val < _opts.disconnect) {
      return Fault::DISCONNECT;
    } else if (val < _opts.disconnect + _opts.response_failure) {
      return Fault::RESPONSE;
    }
    return Fault::NONE;
  }

private:
  double _roll()
  {
    return _distribution(_generator);
  }

  const SimulationOptions& _opts;
  std::mutex _mutex;
  std::mt19937 _generator;
  std::uniform_real_distribution<double> _distribution{0.0, 1.0};
};

class SimulatedConnection : public Connection, public std::enable_shared_from_this<SimulatedConnection> {
public:
  SimulatedConnection(
      Address endpoint, InvocationRegistry& registry, BS::thread_pool& network,
      FaultInjector& faults, std::chrono::microseconds latency
  )
      : _endpoint(std::move(endpoint)), _registry(registry), _network(network), _faults(faults),
        _latency(latency)
  {
  }

  const Address& endpoint() const override
  {
    return _endpoint;
  }

  bool is_alive() const override
  {
    return _alive;
  }

  bool is_heartbeating() const override
  {
    return _alive;
  }

  bool write(const ClientMessagePtr& message) override
  {
    if (!_alive || _faults.on_write() != FaultInjector::Fault::NONE) {
      return false;
    }

    int64_t correlation_id = message->correlation_id();
    _network.detach_task([self = shared_from_this(), correlation_id]() {
      self->_reply(correlation_id);
    });
    return true;
  }

  void add_event_handler(int64_t, EventHandlerPtr) override {}

  void remove_event_handler(int64_t) override {}

  void close()
  {
    _alive = false;
  }

private:
  void _reply(int64_t correlation_id)
  {
    std::this_thread::sleep_for(_latency);

    switch (_faults.on_response()) {
    case FaultInjector::Fault::DISCONNECT:
      if (_alive.exchange(false)) {
        spdlog::debug("Member {} dropped its connection", _endpoint.to_string());
        _registry.connection_closed(shared_from_this());
      }
      break;
    case FaultInjector::Fault::RESPONSE:
      _registry.handle_exception(
          correlation_id,
          std::make_exception_ptr(InstanceNotActiveError(
              fmt::format("Member {} is not ready to serve requests", _endpoint.to_string())
          ))
      );
      break;
    default: {
      auto response = std::make_shared<ClientMessage>(1);
      response->correlation_id(correlation_id);
      _registry.handle_response(correlation_id, response);
    }
    }
  }

  Address _endpoint;
  std::atomic<bool> _alive{true};

  InvocationRegistry& _registry;
  BS::thread_pool& _network;
  FaultInjector& _faults;
  std::chrono::microseconds _latency;
};

// Static membership with lazily opened connections that reconnect after a drop.
class SimulatedCluster : public PartitionTable,
                         public ClusterView,
                         public ConnectionManager,
                         public LoadBalancer {
public:
  SimulatedCluster(
      const SimulationOptions& opts, InvocationRegistry& registry, FaultInjector& faults
  )
      : _network(opts.network_threads), _registry(registry), _faults(faults),
        _latency(opts.latency_us)
  {
    for (int i = 0; i < opts.members; ++i) {
      _members.push_back(Address{fmt::format("10.0.0.{}", i + 1), 5701});
    }
  }

  std::optional<Address> partition_owner(int32_t partition_id) const override
  {
    if (_members.empty()) {
      return std::nullopt;
    }
    return _members[partition_id % _members.size()];
  }

  bool is_member(const Address& address) const override
  {
    return std::find(_members.begin(), _members.end(), address) != _members.end();
  }

  ConnectionPtr get_or_connect(const Address& address) override
  {
    std::unique_lock<std::mutex> lock{_mutex};

    auto& conn = _connections[address];
    if (!conn || !conn->is_alive()) {
      conn = std::make_shared<SimulatedConnection>(address, _registry, _network, _faults, _latency);
    }
    return conn;
  }

  std::optional<Address> next() override
  {
    if (_members.empty()) {
      return std::nullopt;
    }
    return _members[_round_robin++ % _members.size()];
  }

  const std::vector<Address>& members() const
  {
    return _members;
  }

  void shutdown()
  {
    _network.wait();

    std::unique_lock<std::mutex> lock{_mutex};
    for (auto& [address, conn] : _connections) {
      conn->close();
    }
  }

private:
  BS::thread_pool _network;

  InvocationRegistry& _registry;
  FaultInjector& _faults;
  std::chrono::microseconds _latency;

  std::vector<Address> _members;
  std::atomic<size_t> _round_robin{0};

  std::mutex _mutex;
  std::unordered_map<Address, std::shared_ptr<SimulatedConnection>, AddressHash> _connections;
};

class Tally {
public:
  void success()
  {
    std::unique_lock<std::mutex> lock{_mutex};
    ++_successes;
  }

  void failure(const std::exception_ptr& error)
  {
    std::unique_lock<std::mutex> lock{_mutex};
    ++_failures[classify(error)];
  }

  void report(std::chrono::milliseconds duration) const
  {
    std::unique_lock<std::mutex> lock{_mutex};

    spdlog::info("Finished in {} ms, {} successful invocations", duration.count(), _successes);
    for (auto& [category, count] : _failures) {
      spdlog::info("Failed with {}: {}", to_string(category), count);
    }
  }

private:
  mutable std::mutex _mutex;
  size_t _successes = 0;
  std::map<ErrorCategory, size_t> _failures;
};

binding::Binding pick_binding(int idx, const SimulationOptions& opts, const SimulatedCluster& cluster)
{
  switch (idx % 3) {
  case 0:
    return binding::Partition{static_cast<int32_t>(idx % opts.partitions)};
  case 1:
    return binding::Target{cluster.members()[idx % cluster.members().size()]};
  default:
    return binding::Random{};
  }
}

int main(int argc, char** argv)
{
  auto cfg = config::Config::deserialize(argc, argv);
  auto opts = simulation_opts(argc, argv);

  if (cfg.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info(
      "Simulating {} invocations on {} members, timeout {} ms, retry wait {} ms",
      opts.invocations, opts.members, cfg.invocation.invocation_timeout_ms,
      cfg.invocation.retry_wait_ms
  );

  if (opts.members <= 0 || opts.partitions <= 0 || opts.network_threads <= 0) {
    spdlog::error("Members, partitions and network threads must be positive");
    return 1;
  }

  ClientLifecycle lifecycle;
  InvocationRegistry registry;
  FaultInjector faults{opts};
  SimulatedCluster cluster{opts, registry, faults};

  ExecutionService execution{cfg.executors};
  registry.start_housekeeping(execution, cfg.housekeeping.cleanup_interval());

  SmartInvocationService service{registry, cluster, cluster, cluster, cluster};
  auto call_ids = CallIdFactory::create(cfg.invocation);

  InvocationContext context{lifecycle,  service, *call_ids, execution, execution.user_executor(),
                            cfg.invocation};
  lifecycle.start();

  Tally tally;
  std::vector<InvocationFuturePtr> futures;
  futures.reserve(opts.invocations);

  auto begin = std::chrono::steady_clock::now();
  for (int i = 0; i < opts.invocations; ++i) {

    auto message = std::make_shared<ClientMessage>(0, std::vector<char>{}, i % 2 == 0);
    auto invocation = Invocation::create(context, message, pick_binding(i, opts, cluster));

    try {
      auto future = invocation->invoke();
      future->and_then([&tally](const ClientMessagePtr& response, const std::exception_ptr& error) {
        if (response) {
          tally.success();
        } else {
          tally.failure(error);
        }
      });
      futures.emplace_back(std::move(future));
    } catch (OverloadError&) {
      tally.failure(std::current_exception());
    }
  }

  auto deadline = begin + std::chrono::milliseconds{opts.wait_ms};
  size_t unfinished = 0;
  for (auto& future : futures) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()
    );
    if (!future->wait_for(std::max(remaining, std::chrono::milliseconds{0}))) {
      ++unfinished;
    }
  }
  auto end = std::chrono::steady_clock::now();

  lifecycle.begin_shutdown();
  service.shutdown();
  cluster.shutdown();
  // Continuations of the failed invocations still need the user executor.
  registry.shutdown();
  execution.shutdown();
  lifecycle.finish_shutdown();

  tally.report(std::chrono::duration_cast<std::chrono::milliseconds>(end - begin));
  if (unfinished > 0) {
    spdlog::warn("{} invocations did not finish in {} ms", unfinished, opts.wait_ms);
  }
  spdlog::info(
      "Outstanding correlation ids {}, registered invocations {}", call_ids->concurrent_invocations(),
      registry.size()
  );

  return 0;
}
