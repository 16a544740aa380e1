#include <grid/client/config.hpp>

#include <grid/common/exceptions.hpp>
#include <grid/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace grid::client::config {

  void Invocation::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(invocation_timeout_ms));
    archive(CEREAL_NVP(retry_wait_ms));
    archive(CEREAL_NVP(redo_operation));
    archive(CEREAL_NVP(max_concurrent_invocations));
    archive(CEREAL_NVP(backoff_timeout_ms));

    if (invocation_timeout_ms <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Invocation timeout must be positive, got {}", invocation_timeout_ms)
      );
    }
    if (retry_wait_ms <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Retry wait must be positive, got {}", retry_wait_ms)
      );
    }
  }

  void Invocation::set_defaults()
  {
    invocation_timeout_ms = DEFAULT_INVOCATION_TIMEOUT_MS;
    retry_wait_ms = DEFAULT_RETRY_WAIT_MS;
    redo_operation = false;
    max_concurrent_invocations = DEFAULT_MAX_CONCURRENT_INVOCATIONS;
    backoff_timeout_ms = DEFAULT_BACKOFF_TIMEOUT_MS;
  }

  void Executors::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(internal_threads));
    archive(CEREAL_NVP(user_threads));
    archive(CEREAL_NVP(max_scheduled_tasks));

    if (internal_threads <= 0 || user_threads <= 0) {
      throw common::InvalidConfigurationError(fmt::format(
          "Executors require at least one thread, got internal {} user {}", internal_threads,
          user_threads
      ));
    }
  }

  void Executors::set_defaults()
  {
    internal_threads = DEFAULT_INTERNAL_THREADS;
    user_threads = DEFAULT_USER_THREADS;
    max_scheduled_tasks = 0;
  }

  void Housekeeping::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(cleanup_interval_ms));
  }

  void Housekeeping::set_defaults()
  {
    cleanup_interval_ms = DEFAULT_CLEANUP_INTERVAL_MS;
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cfg.set_defaults();
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("grid-client", "Cluster client invocation layer.");
    options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>());
    options.allow_unrecognised_options();
    auto parsed_options = options.parse(argc, argv);

    Config cfg;
    cfg.set_defaults();

    if (parsed_options.count("config") > 0) {

      std::string config_file{parsed_options["config"].as<std::string>()};
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not open config file {}", config_file)
        );
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    }

    return cfg;
  }

  void Config::set_defaults()
  {
    verbose = false;

    invocation.set_defaults();
    executors.set_defaults();
    housekeeping.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(verbose));

    common::util::cereal_load_optional(archive, "invocation", this->invocation);
    common::util::cereal_load_optional(archive, "executors", this->executors);
    common::util::cereal_load_optional(archive, "housekeeping", this->housekeeping);
  }

} // namespace grid::client::config
