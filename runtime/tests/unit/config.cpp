#include <cumulus/common/exceptions.hpp>
#include <cumulus/runtime/handler/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <gtest/gtest.h>

using namespace cumulus::runtime;

TEST(HandlerConfig, Defaults)
{
  config::Handler cfg;
  cfg.set_defaults();

  EXPECT_TRUE(cfg.store_status);
  EXPECT_FALSE(cfg.verbose);
  EXPECT_EQ(
      std::filesystem::path{cfg.runner_path}.filename().string(),
      std::string{config::Handler::DEFAULT_RUNNER_NAME}
  );
  EXPECT_EQ(cfg.scratch_root.rfind(config::Handler::DEFAULT_SCRATCH_PREFIX, 0), 0);
}

TEST(HandlerConfig, Deserialize)
{
  std::string config = R"(
    {
      "runner-path": "/opt/cumulus/bin/cumulus_jobrunner",
      "store-status": false
    }
  )";
  std::stringstream stream{config};

  auto cfg = config::Handler::deserialize(stream);
  EXPECT_EQ(cfg.runner_path, "/opt/cumulus/bin/cumulus_jobrunner");
  EXPECT_FALSE(cfg.store_status);
  // Missing fields keep their defaults.
  EXPECT_FALSE(cfg.verbose);
  EXPECT_FALSE(cfg.scratch_root.empty());

  std::stringstream invalid{R"({"store-status": "sometimes"})"};
  EXPECT_THROW(config::Handler::deserialize(invalid), cumulus::common::InvalidConfigurationError);
}

TEST(HandlerConfig, Environment)
{
  config::Handler cfg;
  cfg.set_defaults();

  setenv("STORE_STATUS", "False", 1);
  setenv("CUMULUS_SCRATCH_DIR", "/tmp/cumulus-scratch", 1);
  cfg.load_env();
  unsetenv("STORE_STATUS");
  unsetenv("CUMULUS_SCRATCH_DIR");

  EXPECT_FALSE(cfg.store_status);
  EXPECT_EQ(cfg.scratch_root, "/tmp/cumulus-scratch");

  setenv("STORE_STATUS", "perhaps", 1);
  EXPECT_THROW(cfg.load_env(), cumulus::common::InvalidConfigurationError);
  unsetenv("STORE_STATUS");
}
