#include <gtest/gtest.h>
#include <sszgen/output/source_writer.hpp>
#include <sszgen/testing/common.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace {

class source_writer_test : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = sszgen::testing::make_temp_path("sszgen_writer");
  }

  void TearDown() override { sszgen::testing::remove_path(root_); }

  std::filesystem::path root_;
};

}  // namespace

TEST_F(source_writer_test, fragments_are_concatenated_in_order) {
  auto config = sszgen::generator_config_t{.target_dir = root_};
  auto path = root_ / "nested" / "boolean_test.cpp";
  sszgen::output::write_source(
      config, path, std::vector<std::string>{"// head\n", "\nTEST(a, b) {}\n"});
  EXPECT_EQ(sszgen::testing::read_file(path), "// head\n\nTEST(a, b) {}\n");
}

TEST_F(source_writer_test, existing_file_is_replaced) {
  auto config = sszgen::generator_config_t{.target_dir = root_};
  auto path = root_ / "uints_test.cpp";
  sszgen::testing::write_file(path, "a much longer stale generated source\n");
  sszgen::output::write_source(config, path, std::vector<std::string>{"new\n"});
  EXPECT_EQ(sszgen::testing::read_file(path), "new\n");
}

TEST_F(source_writer_test, dry_run_prints_instead_of_writing) {
  auto config = sszgen::generator_config_t{.target_dir = root_,
                                           .dry_run = true};
  auto path = root_ / "uints_test.cpp";

  ::testing::internal::CaptureStdout();
  sszgen::output::write_source(config, path,
                               std::vector<std::string>{"first", "second"});
  auto printed = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(printed, "first\nsecond\n");
  EXPECT_FALSE(std::filesystem::exists(path));
}
