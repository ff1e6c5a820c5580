#pragma once

#include <sszgen/fixture/category.hpp>
#include <sszgen/fixture/fixture_case.hpp>

#include <filesystem>

namespace sszgen::fixture {

/// Directory holding the cases of `category` in `format`.
std::filesystem::path suite_path(const std::filesystem::path& corpus_root,
                                 category_t category,
                                 format_t format);

/// Populate `cases` from one case directory.
///
/// Each child is classified by name: `meta` files give the root, `value`
/// files give the value tree and `ssz_snappy` files are the payload. Any
/// other child is fatal, as is a directory without a payload.
void load_case(const std::filesystem::path& case_directory,
               format_t format,
               fixture_cases_t& cases);

/// Load every case of `category` in `format` into `cases`.
///
/// Called once per format against the same map.
void load_cases(const std::filesystem::path& corpus_root,
                category_t category,
                format_t format,
                fixture_cases_t& cases);

}  // namespace sszgen::fixture
