#include <gtest/gtest.h>

#ifdef _WIN32
#  include <process.h>
#  define GETPID() _getpid()
#else
#  include <unistd.h>
#  define GETPID() getpid()
#endif

#include <cstdio>
#include <filesystem>
#include <xrayopt_core/config.hpp>

using namespace xrayopt;

TEST(OptimizerConfigTest, Defaults) {
  OptimizerConfig config;
  EXPECT_DOUBLE_EQ(config.default_target_size_mb, 10.0);
  EXPECT_EQ(config.fallback_strategy, "quantization");
  EXPECT_EQ(config.default_model, "efficientnet");
  EXPECT_DOUBLE_EQ(config.scoring.size, 0.4);
  EXPECT_DOUBLE_EQ(config.scoring.speed, 0.3);
  EXPECT_DOUBLE_EQ(config.scoring.accuracy, 0.3);
  EXPECT_DOUBLE_EQ(config.metric_defaults.size_mb, 100.0);
  EXPECT_NO_THROW(config.validate());
}

TEST(OptimizerConfigTest, PartialJsonKeepsDefaults) {
  auto config = OptimizerConfig::from_json_string(R"({
    "default_target_size_mb": 25.0,
    "scoring": {"size": 0.6}
  })");

  EXPECT_DOUBLE_EQ(config.default_target_size_mb, 25.0);
  EXPECT_EQ(config.fallback_strategy, "quantization");
  EXPECT_DOUBLE_EQ(config.scoring.size, 0.6);
  EXPECT_DOUBLE_EQ(config.scoring.speed, 0.3);
  EXPECT_DOUBLE_EQ(config.metric_defaults.inference_time_ms, 500.0);
}

TEST(OptimizerConfigTest, MetricDefaultsFromJson) {
  auto config = OptimizerConfig::from_json_string(R"({
    "metric_defaults": {"size_mb": 50.0, "parameters": 42}
  })");

  EXPECT_DOUBLE_EQ(config.metric_defaults.size_mb, 50.0);
  EXPECT_EQ(config.metric_defaults.parameters, 42);
  EXPECT_DOUBLE_EQ(config.metric_defaults.accuracy, 0.92);
}

TEST(OptimizerConfigTest, StringRoundTrip) {
  OptimizerConfig config;
  config.default_target_size_mb = 3.5;
  config.fallback_strategy = "optimization";
  config.default_model = "resnet50";
  config.scoring = {.size = 0.5, .speed = 0.25, .accuracy = 0.25};

  auto loaded = OptimizerConfig::from_json_string(config.to_json_string());
  EXPECT_DOUBLE_EQ(loaded.default_target_size_mb, 3.5);
  EXPECT_EQ(loaded.fallback_strategy, "optimization");
  EXPECT_EQ(loaded.default_model, "resnet50");
  EXPECT_DOUBLE_EQ(loaded.scoring.size, 0.5);
  EXPECT_DOUBLE_EQ(loaded.scoring.accuracy, 0.25);
}

TEST(OptimizerConfigTest, FileOperations) {
  auto temp_dir = std::filesystem::temp_directory_path();
  std::string path
      = (temp_dir / ("xrayopt_config_" + std::to_string(GETPID()) + ".json")).string();

  OptimizerConfig config;
  config.default_model = "mobilenetv2";
  config.to_json(path);

  auto loaded = OptimizerConfig::from_json(path);
  EXPECT_EQ(loaded.default_model, "mobilenetv2");

  std::remove(path.c_str());
}

TEST(OptimizerConfigTest, MissingFileThrows) {
  EXPECT_THROW(OptimizerConfig::from_json("/nonexistent/xrayopt_config.json"),
               std::runtime_error);
}

TEST(OptimizerConfigTest, MalformedJsonThrows) {
  EXPECT_THROW(OptimizerConfig::from_json_string("{not json"), nlohmann::json::parse_error);
}

TEST(OptimizerConfigTest, Validation) {
  OptimizerConfig config;

  config.default_target_size_mb = -1.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = OptimizerConfig{};
  config.fallback_strategy.clear();
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = OptimizerConfig{};
  config.scoring.speed = -0.1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = OptimizerConfig{};
  config.metric_defaults.size_mb = 0.0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  EXPECT_THROW(OptimizerConfig::from_json_string(R"({"default_target_size_mb": 0})"),
               std::invalid_argument);
}
