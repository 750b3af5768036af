#include <gtest/gtest.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  spdlog::set_default_logger(spdlog::stderr_color_mt("stderr"));
  spdlog::set_level(spdlog::level::warn);
  spdlog::cfg::load_env_levels();
  return RUN_ALL_TESTS();
}
