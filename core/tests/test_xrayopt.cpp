#include <gtest/gtest.h>

#include <xrayopt_core/xrayopt.hpp>

using namespace xrayopt;

class XrayOptTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto created = XrayOpt::from_builtin();
    ASSERT_TRUE(created.has_value()) << created.error();
    engine_.emplace(std::move(created).value());
  }

  std::optional<XrayOpt> engine_;
};

TEST_F(XrayOptTest, AvailableModels) {
  auto models = engine_->available_models();
  EXPECT_EQ(models.size(), 4u);
  EXPECT_EQ(models.front(), "vgg16");
}

TEST_F(XrayOptTest, OptimizeKnownModel) {
  auto result = engine_->optimize("resnet50", "quantization", 10.0);
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->ok());
  EXPECT_NEAR(result->optimized_metrics.metrics.size_mb, 24.5, 1e-9);
  EXPECT_EQ(result->original_metrics.parameters, 25'636'712);
}

TEST_F(XrayOptTest, UnknownModelIsAnError) {
  auto optimized = engine_->optimize("alexnet", "pruning");
  ASSERT_FALSE(optimized.has_value());
  EXPECT_EQ(optimized.error(), "Model alexnet not found");

  EXPECT_FALSE(engine_->compare("alexnet").has_value());
  EXPECT_FALSE(engine_->report("alexnet").has_value());
}

TEST_F(XrayOptTest, UnknownOptimizationTypeIsAnErrorEntry) {
  auto result = engine_->optimize("resnet50", "compression");
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->ok());
  EXPECT_EQ(*result->error, "Unknown optimization type: compression");
}

TEST_F(XrayOptTest, EmptyModelTypeUsesDefaultModel) {
  auto info = engine_->model_info("");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ((*info)["name"].get<std::string>(), "efficientnet");

  auto report = engine_->report("");
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->model_info["name"].get<std::string>(), "efficientnet");
}

TEST_F(XrayOptTest, CompareMatchesOptimizer) {
  auto comparison = engine_->compare("mobilenetv2", 5.0);
  ASSERT_TRUE(comparison.has_value());

  auto direct = engine_->optimizer().compare_strategies(*engine_->model_info("mobilenetv2"), 5.0);
  ASSERT_TRUE(direct.has_value());
  EXPECT_EQ(comparison->best_strategy, direct->best_strategy);
  EXPECT_EQ(nlohmann::json(*comparison), nlohmann::json(*direct));
}

TEST(XrayOptFactoryTest, InvalidCatalogRejected) {
  auto created = XrayOpt::from_catalog(ModelCatalog{});
  ASSERT_FALSE(created.has_value());
  EXPECT_EQ(created.error(), "models array cannot be empty");
}

TEST(XrayOptFactoryTest, InvalidConfigRejected) {
  OptimizerConfig config;
  config.fallback_strategy.clear();
  EXPECT_FALSE(XrayOpt::from_builtin(config).has_value());
}

TEST(XrayOptFactoryTest, CustomDefaultModel) {
  OptimizerConfig config;
  config.default_model = "vgg16";
  auto created = XrayOpt::from_builtin(config);
  ASSERT_TRUE(created.has_value());

  auto result = created->optimize("", "optimization");
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->optimized_metrics.metrics.size_mb, 528.0 * 0.85, 1e-9);
}
