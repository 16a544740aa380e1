#ifndef GRID_COMMON_UTIL_HPP
#define GRID_COMMON_UTIL_HPP

#include <grid/common/exceptions.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace grid::common::util {

  template <class... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse {} configuration, reason: {}", name, exc.what())
        );
      }
    }
  }

} // namespace grid::common::util

#endif
