#include <grid/client/config.hpp>
#include <grid/common/exceptions.hpp>

#include <sstream>

#include <gtest/gtest.h>

using namespace grid::client::config;

TEST(Config, BasicConfig)
{
  std::string config = R"(
    {
      "verbose": true
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.verbose, true);

  EXPECT_EQ(cfg.invocation.invocation_timeout_ms, Invocation::DEFAULT_INVOCATION_TIMEOUT_MS);
  EXPECT_EQ(cfg.invocation.retry_wait_ms, Invocation::DEFAULT_RETRY_WAIT_MS);
  EXPECT_EQ(cfg.invocation.redo_operation, false);
  EXPECT_EQ(cfg.invocation.max_concurrent_invocations, Invocation::DEFAULT_MAX_CONCURRENT_INVOCATIONS);
  EXPECT_EQ(cfg.invocation.backoff_timeout_ms, Invocation::DEFAULT_BACKOFF_TIMEOUT_MS);
  EXPECT_EQ(cfg.invocation.invocation_timeout(), std::chrono::seconds{120});

  EXPECT_EQ(cfg.executors.internal_threads, Executors::DEFAULT_INTERNAL_THREADS);
  EXPECT_EQ(cfg.executors.user_threads, Executors::DEFAULT_USER_THREADS);
  EXPECT_EQ(cfg.executors.max_scheduled_tasks, 0);

  EXPECT_EQ(cfg.housekeeping.cleanup_interval_ms, Housekeeping::DEFAULT_CLEANUP_INTERVAL_MS);
}

TEST(Config, InvocationConfig)
{
  std::string config = R"(
    {
      "verbose": false,
      "invocation": {
        "invocation_timeout_ms": 5000,
        "retry_wait_ms": 250,
        "redo_operation": true,
        "max_concurrent_invocations": 64,
        "backoff_timeout_ms": 100
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.verbose, false);
  EXPECT_EQ(cfg.invocation.invocation_timeout(), std::chrono::milliseconds{5000});
  EXPECT_EQ(cfg.invocation.retry_wait(), std::chrono::milliseconds{250});
  EXPECT_EQ(cfg.invocation.redo_operation, true);
  EXPECT_EQ(cfg.invocation.max_concurrent_invocations, 64);
  EXPECT_EQ(cfg.invocation.backoff_timeout_ms, 100);

  EXPECT_EQ(cfg.executors.internal_threads, Executors::DEFAULT_INTERNAL_THREADS);
}

TEST(Config, ExecutorsAndHousekeeping)
{
  std::string config = R"(
    {
      "verbose": true,
      "executors": {
        "internal_threads": 4,
        "user_threads": 8,
        "max_scheduled_tasks": 1000
      },
      "housekeeping": {
        "cleanup_interval_ms": 250
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.executors.internal_threads, 4);
  EXPECT_EQ(cfg.executors.user_threads, 8);
  EXPECT_EQ(cfg.executors.max_scheduled_tasks, 1000);
  EXPECT_EQ(cfg.housekeeping.cleanup_interval(), std::chrono::milliseconds{250});

  EXPECT_EQ(cfg.invocation.retry_wait_ms, Invocation::DEFAULT_RETRY_WAIT_MS);
}

TEST(Config, InvalidConfig)
{
  {
    std::string config = R"(
      {
        "verbose": true,
        "invocation": {
          "invocation_timeout_ms": 5000,
          "retry_wait_ms": 0,
          "redo_operation": false,
          "max_concurrent_invocations": -1,
          "backoff_timeout_ms": -1
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), grid::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "executors": {
          "internal_threads": 0,
          "user_threads": 1,
          "max_scheduled_tasks": 0
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), grid::common::InvalidConfigurationError);
  }

  // Incomplete section.
  {
    std::string config = R"(
      {
        "verbose": true,
        "invocation": {
          "retry_wait_ms": 10
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), grid::common::InvalidConfigurationError);
  }
}
