#ifndef GRID_CLIENT_ADDRESS_HPP
#define GRID_CLIENT_ADDRESS_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace grid::client {

  struct Address {

    std::string host;
    int port{};

    std::string to_string() const
    {
      return host + ":" + std::to_string(port);
    }

    bool operator==(const Address& other) const
    {
      return port == other.port && host == other.host;
    }

    bool operator!=(const Address& other) const
    {
      return !(*this == other);
    }
  };

  struct AddressHash {
    size_t operator()(const Address& addr) const
    {
      return std::hash<std::string>{}(addr.host) ^ (std::hash<int>{}(addr.port) << 1);
    }
  };

} // namespace grid::client

#endif
