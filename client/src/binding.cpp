#include <grid/client/binding.hpp>

#include <grid/client/message.hpp>
#include <grid/common/util.hpp>

namespace grid::client::binding {

  Binding select(
      ConnectionPtr connection, int32_t partition_id, const std::optional<Address>& address
  )
  {
    if (connection) {
      return BoundConnection{std::move(connection)};
    } else if (partition_id != ClientMessage::UNASSIGNED_PARTITION) {
      return Partition{partition_id};
    } else if (address.has_value()) {
      return Target{address.value()};
    }
    return Random{};
  }

  bool is_bound_to_single_connection(const Binding& binding)
  {
    return std::holds_alternative<BoundConnection>(binding);
  }

  int32_t partition_id(const Binding& binding)
  {
    if (auto* ptr = std::get_if<Partition>(&binding)) {
      return ptr->partition_id;
    }
    return ClientMessage::UNASSIGNED_PARTITION;
  }

  std::string_view name(const Binding& binding)
  {
    return std::visit(
        common::util::overloaded{
            [](const BoundConnection&) -> std::string_view { return "connection"; },
            [](const Partition&) -> std::string_view { return "partition"; },
            [](const Target&) -> std::string_view { return "target"; },
            [](const Random&) -> std::string_view { return "random"; }},
        binding
    );
  }

} // namespace grid::client::binding
