#include <gtest/gtest.h>
#include <sszgen/fixture/loader.hpp>
#include <sszgen/testing/common.hpp>

#include <optional>
#include <string_view>

namespace {

using sszgen::fixture::category_t;
using sszgen::fixture::format_t;

class loader_test : public ::testing::Test {
 protected:
  void SetUp() override {
    corpus_ = sszgen::testing::make_temp_path("sszgen_loader");
  }

  void TearDown() override { sszgen::testing::remove_path(corpus_); }

  std::filesystem::path corpus_;
};

}  // namespace

TEST_F(loader_test, valid_case_carries_root_value_and_payload) {
  auto directory = sszgen::testing::write_case(
      corpus_, category_t::uints, format_t::valid, "uint_8_max",
      std::string_view{"{root: '0xff00000000000000000000000000000000000000000000"
                       "000000000000000000'}\n"},
      std::string_view{"'255'\n"});

  auto cases = sszgen::fixture::fixture_cases_t{};
  sszgen::fixture::load_cases(corpus_, category_t::uints, format_t::valid,
                              cases);

  ASSERT_EQ(cases.size(), 1u);
  const auto& test_case = cases.at("uint_8_max");
  EXPECT_EQ(test_case.format, format_t::valid);
  ASSERT_TRUE(test_case.root.has_value());
  EXPECT_TRUE(test_case.root->starts_with("0xff00"));
  ASSERT_TRUE(test_case.value.has_value());
  EXPECT_EQ(test_case.value->scalar("test"), "255");
  ASSERT_TRUE(test_case.data_path.has_value());
  EXPECT_EQ(*test_case.data_path, directory / "serialized.ssz_snappy");
}

TEST_F(loader_test, valid_and_invalid_cases_share_one_map) {
  sszgen::testing::write_case(corpus_, category_t::boolean, format_t::valid,
                              "true", std::string_view{"{root: '0x01'}\n"},
                              std::string_view{"true\n"});
  sszgen::testing::write_case(corpus_, category_t::boolean, format_t::valid,
                              "false", std::string_view{"{root: '0x00'}\n"},
                              std::string_view{"false\n"});
  sszgen::testing::write_case(corpus_, category_t::boolean, format_t::invalid,
                              "byte_2", std::nullopt, std::nullopt);

  auto cases = sszgen::fixture::fixture_cases_t{};
  sszgen::fixture::load_cases(corpus_, category_t::boolean, format_t::valid,
                              cases);
  sszgen::fixture::load_cases(corpus_, category_t::boolean, format_t::invalid,
                              cases);

  ASSERT_EQ(cases.size(), 3u);
  auto it = cases.begin();
  EXPECT_EQ(it->first, "byte_2");
  EXPECT_EQ(it->second.format, format_t::invalid);
  EXPECT_FALSE(it->second.root.has_value());
  EXPECT_FALSE(it->second.value.has_value());
  EXPECT_TRUE(it->second.data_path.has_value());
  ++it;
  EXPECT_EQ(it->first, "false");
  ++it;
  EXPECT_EQ(it->first, "true");
  EXPECT_EQ(it->second.value->scalar("test"), "true");
}

TEST_F(loader_test, suite_path_follows_corpus_layout) {
  EXPECT_EQ(sszgen::fixture::suite_path(corpus_, category_t::bitvector,
                                        format_t::invalid),
            corpus_ / "bitvector" / "invalid");
}

TEST_F(loader_test, unrecognized_child_is_fatal_and_named) {
  auto directory = sszgen::testing::write_case(
      corpus_, category_t::bitlist, format_t::valid, "bitlist_1_zero",
      std::nullopt, std::string_view{"'0x01'\n"});
  sszgen::testing::write_file(directory / "notes.txt", "stray");

  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        auto cases = sszgen::fixture::fixture_cases_t{};
        sszgen::fixture::load_case(directory, format_t::valid, cases);
      },
      "Unexpected file .*notes.txt");
}

TEST_F(loader_test, case_without_payload_is_fatal) {
  auto directory = corpus_ / "bitlist" / "valid" / "bitlist_2_zero";
  sszgen::testing::write_file(directory / "value.yaml", "'0x04'\n");

  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        auto cases = sszgen::fixture::fixture_cases_t{};
        sszgen::fixture::load_case(directory, format_t::valid, cases);
      },
      "has no ssz_snappy payload");
}

TEST_F(loader_test, metadata_without_root_is_fatal) {
  auto directory = sszgen::testing::write_case(
      corpus_, category_t::uints, format_t::valid, "uint_16_zero",
      std::string_view{"{other: 1}\n"}, std::string_view{"0\n"});

  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        auto cases = sszgen::fixture::fixture_cases_t{};
        sszgen::fixture::load_case(directory, format_t::valid, cases);
      },
      "has no 'root' string");
}

TEST_F(loader_test, malformed_root_is_fatal) {
  auto directory = sszgen::testing::write_case(
      corpus_, category_t::uints, format_t::valid, "uint_16_zero",
      std::string_view{"{root: '0xnothex'}\n"}, std::string_view{"0\n"});

  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        auto cases = sszgen::fixture::fixture_cases_t{};
        sszgen::fixture::load_case(directory, format_t::valid, cases);
      },
      "has a malformed root '0xnothex'");
}

TEST_F(loader_test, missing_suite_directory_is_fatal) {
  EXPECT_DEATH(
      {
        sszgen::testing::log_to_stderr();
        auto cases = sszgen::fixture::fixture_cases_t{};
        sszgen::fixture::load_cases(corpus_, category_t::containers,
                                    format_t::valid, cases);
      },
      "is not a directory");
}
