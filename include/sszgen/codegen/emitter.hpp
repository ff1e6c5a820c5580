#pragma once

#include <sszgen/config.hpp>
#include <sszgen/fixture/category.hpp>
#include <sszgen/fixture/fixture_case.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sszgen::codegen {

inline constexpr auto kSourcePreamble =
    std::string_view{R"(// This file was generated by `ssz_test_gen`; do NOT manually edit.
#include <gtest/gtest.h>
#include <ssz/ssz.hpp>

#include "test_utils.hpp"

#include <array>
#include <cstdint>
#include <vector>

using ssz::testing::deserialize;
using ssz::testing::hash_tree_root;
using ssz::testing::read_ssz_snappy_from_test_data;
using ssz::testing::root_from_hex;
using ssz::testing::serialize;
)"};

/// Test for one case; `data_path` is the project-relative payload path.
///
/// A valid case without a value tree is fatal.
std::string emit_case(fixture::category_t category,
                      std::string_view name,
                      const fixture::fixture_case_t& test_case,
                      std::string_view data_path);

/// The complete source unit for `config.category`, in emission order:
/// preamble, container definitions (containers only), one test per case.
std::vector<std::string> emit_source(const generator_config_t& config,
                                     const fixture::fixture_cases_t& cases);

}  // namespace sszgen::codegen
