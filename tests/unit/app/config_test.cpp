#include <docscan/app/config.hpp>
#include <docscan/core/error.hpp>
#include <docscan/qr/region_tiling.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace da = docscan::app;
namespace dq = docscan::qr;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("docscan_config_" + std::string(::testing::UnitTest::GetInstance()
                                                 ->current_test_info()
                                                 ->name()) +
             ".conf");
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string write(const std::string& contents) {
    std::ofstream f(path_);
    f << contents;
    return path_.string();
  }

  std::filesystem::path path_;
};

}  // namespace

TEST(Config, Defaults) {
  const auto c = da::default_config();
  EXPECT_TRUE(c.fallback_enabled);
  EXPECT_EQ(c.fallback_policy, dq::FallbackPolicy::StopAtFirstMatch);
  EXPECT_EQ(c.fallback_min_dimension, 400u);
  ASSERT_EQ(c.fallback_scales.size(), 3u);
  EXPECT_FLOAT_EQ(c.fallback_scales[0], 1.5f);
  EXPECT_FLOAT_EQ(c.fallback_scales[1], 2.0f);
  EXPECT_FLOAT_EQ(c.fallback_scales[2], 2.5f);
  EXPECT_EQ(c.mrz_min_line_length, 20u);
  EXPECT_EQ(c.num_workers, 0u);
  EXPECT_TRUE(da::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = da::load_config("/nonexistent/docscan.conf");
  EXPECT_TRUE(c.fallback_enabled);
  EXPECT_EQ(c.fallback_scales.size(), 3u);
}

TEST_F(ConfigFileTest, ReadsAllKeys) {
  const auto c = da::load_config(write(
      "# scanner settings\n"
      "fallback_enabled = false\n"
      "fallback_policy=exhaustive\n"
      "fallback_min_dimension=640\n"
      "fallback_scales=1.25, 3\n"
      "\n"
      "mrz_min_line_length=30\n"
      "num_workers=4\n"
      "unknown_key=ignored\n"
      "not a pair\n"));
  EXPECT_FALSE(c.fallback_enabled);
  EXPECT_EQ(c.fallback_policy, dq::FallbackPolicy::Exhaustive);
  EXPECT_EQ(c.fallback_min_dimension, 640u);
  ASSERT_EQ(c.fallback_scales.size(), 2u);
  EXPECT_FLOAT_EQ(c.fallback_scales[0], 1.25f);
  EXPECT_FLOAT_EQ(c.fallback_scales[1], 3.f);
  EXPECT_EQ(c.mrz_min_line_length, 30u);
  EXPECT_EQ(c.num_workers, 4u);
}

TEST_F(ConfigFileTest, MalformedNumberThrows) {
  const auto path = write("fallback_min_dimension=wide\n");
  EXPECT_THROW((void)da::load_config(path), std::invalid_argument);
}

TEST(Config, ValidationRejectsUnusableScales) {
  auto c = da::default_config();
  c.fallback_scales.clear();
  auto empty = da::validate_config(c);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().kind, docscan::core::ErrorKind::InvalidConfig);

  c.fallback_scales = {1.5f, 0.f};
  auto zero = da::validate_config(c);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error().kind, docscan::core::ErrorKind::InvalidConfig);
  EXPECT_FALSE(zero.error().detail.empty());
}

TEST(Config, DetectionOptionsFollowConfig) {
  auto c = da::default_config();
  c.fallback_enabled = false;
  c.fallback_policy = dq::FallbackPolicy::Exhaustive;
  c.fallback_min_dimension = 800;
  c.fallback_scales = {2.f};

  const auto o = da::to_detection_options(c);
  EXPECT_FALSE(o.fallback_enabled);
  EXPECT_EQ(o.policy, dq::FallbackPolicy::Exhaustive);
  EXPECT_EQ(o.fallback_min_dimension, 800u);
  ASSERT_EQ(o.fallback_scales.size(), 1u);
  EXPECT_FLOAT_EQ(o.fallback_scales[0], 2.f);
}
