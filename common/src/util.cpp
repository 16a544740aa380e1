#include <grid/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace grid::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    // Follow the global level configured by the application.
    logger->set_level(spdlog::get_level());
    return logger;
  }

} // namespace grid::common::util
