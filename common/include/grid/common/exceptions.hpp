#ifndef GRID_COMMON_EXCEPTIONS_HPP
#define GRID_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace grid::common {

  struct GridException : std::runtime_error {

    GridException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : GridException {

    InvalidConfigurationError(const std::string& msg) : GridException(msg) {}
  };

  struct InvalidArgumentError : GridException {

    InvalidArgumentError(const std::string& msg) : GridException(msg) {}
  };

  struct ObjectExists : GridException {

    ObjectExists(const std::string& name) : GridException(name) {}
  };

} // namespace grid::common

#endif
