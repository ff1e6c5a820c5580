#include <gtest/gtest.h>
#include <sszgen/driver.hpp>
#include <sszgen/testing/common.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace {

using sszgen::fixture::category_t;
using sszgen::fixture::format_t;

class driver_test : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = sszgen::testing::make_temp_path("sszgen_driver");
    config_ = sszgen::generator_config_t{
        .category = category_t::boolean,
        .corpus_root = root_ / "corpus",
        .target_dir = root_ / "project" / "ssz" / "tests",
        .project_root = root_ / "project",
        .dry_run = false};

    sszgen::testing::write_case(config_.corpus_root, category_t::boolean,
                                format_t::valid, "true",
                                std::string_view{"{root: '0x01'}\n"},
                                std::string_view{"true\n"},
                                std::string_view{"\x01", 1});
    sszgen::testing::write_case(config_.corpus_root, category_t::boolean,
                                format_t::valid, "false",
                                std::string_view{"{root: '0x00'}\n"},
                                std::string_view{"false\n"},
                                std::string_view{"\x00", 1});
    sszgen::testing::write_case(config_.corpus_root, category_t::boolean,
                                format_t::invalid, "byte_2", std::nullopt,
                                std::nullopt, std::string_view{"\x02", 1});
  }

  void TearDown() override { sszgen::testing::remove_path(root_); }

  std::filesystem::path data_path(const std::string_view format,
                                  const std::string_view name) const {
    return config_.target_dir / "data" / "boolean" / std::string{format} /
           std::string{name} / "serialized.ssz_snappy";
  }

  std::filesystem::path root_;
  sszgen::generator_config_t config_;
};

}  // namespace

TEST_F(driver_test, output_path_is_named_after_category) {
  EXPECT_EQ(sszgen::output_path(config_),
            config_.target_dir / "boolean_test.cpp");
  config_.category = category_t::basic_vector;
  EXPECT_EQ(sszgen::output_path(config_),
            config_.target_dir / "basic_vector_test.cpp");
}

TEST_F(driver_test, load_all_cases_merges_valid_and_invalid) {
  auto cases = sszgen::load_all_cases(config_);
  ASSERT_EQ(cases.size(), 3u);
  EXPECT_EQ(cases.at("true").format, format_t::valid);
  EXPECT_EQ(cases.at("false").format, format_t::valid);
  EXPECT_EQ(cases.at("byte_2").format, format_t::invalid);
}

TEST_F(driver_test, generate_writes_source_and_mirrors_payloads) {
  sszgen::generate(config_);

  auto source = sszgen::testing::read_file(sszgen::output_path(config_));
  EXPECT_TRUE(source.starts_with(
      "// This file was generated by `ssz_test_gen`; do NOT manually edit.\n"));
  auto byte_2 = source.find("TEST(boolean, byte_2)");
  auto false_case = source.find("TEST(boolean, false)");
  auto true_case = source.find("TEST(boolean, true)");
  ASSERT_NE(byte_2, std::string::npos);
  ASSERT_NE(false_case, std::string::npos);
  ASSERT_NE(true_case, std::string::npos);
  EXPECT_LT(byte_2, false_case);
  EXPECT_LT(false_case, true_case);
  EXPECT_NE(source.find("read_ssz_snappy_from_test_data(\"ssz/tests/data/"
                        "boolean/valid/true/serialized.ssz_snappy\")"),
            std::string::npos);
  EXPECT_NE(source.find("root_from_hex(\"0x01\")"), std::string::npos);

  EXPECT_EQ(sszgen::testing::read_file(data_path("valid", "true")),
            std::string("\x01", 1));
  EXPECT_EQ(sszgen::testing::read_file(data_path("valid", "false")),
            std::string("\x00", 1));
  EXPECT_EQ(sszgen::testing::read_file(data_path("invalid", "byte_2")),
            std::string("\x02", 1));
}

TEST_F(driver_test, regeneration_is_byte_identical) {
  sszgen::generate(config_);
  auto first = sszgen::testing::read_file(sszgen::output_path(config_));
  sszgen::generate(config_);
  auto second = sszgen::testing::read_file(sszgen::output_path(config_));
  EXPECT_EQ(first, second);
}

TEST_F(driver_test, dry_run_leaves_target_untouched) {
  config_.dry_run = true;

  ::testing::internal::CaptureStdout();
  sszgen::generate(config_);
  auto printed = ::testing::internal::GetCapturedStdout();

  EXPECT_NE(printed.find("TEST(boolean, true)"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(config_.target_dir));
}

TEST_F(driver_test, missing_suite_is_fatal) {
  config_.category = category_t::uints;
  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        sszgen::generate(config_);
      },
      "is not a directory");
}
