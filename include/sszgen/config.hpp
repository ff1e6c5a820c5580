#pragma once

#include <sszgen/fixture/category.hpp>

#include <filesystem>
#include <string_view>

namespace sszgen {

inline constexpr auto kDefaultCorpusRoot = std::string_view{
    "consensus-spec-tests/tests/general/phase0/ssz_generic/"};
inline constexpr auto kDefaultTargetDir = std::string_view{"../ssz/tests/"};
inline constexpr auto kDefaultProjectRoot = std::string_view{".."};

/// The generator must run from a directory whose name contains this, so
/// the relative defaults above point where they should.
inline constexpr auto kWorkingDirectoryMarker = std::string_view{"sszgen"};

/// Settings of one generator run, built once from the command line.
struct generator_config_t final {
  fixture::category_t category{fixture::category_t::boolean};
  // root of the ssz_generic fixture tree
  std::filesystem::path corpus_root{kDefaultCorpusRoot};
  // where `{category}_test.cpp` and `data/` are written
  std::filesystem::path target_dir{kDefaultTargetDir};
  // generated tests name payloads relative to this directory
  std::filesystem::path project_root{kDefaultProjectRoot};
  // print the source and planned copies instead of touching the filesystem
  bool dry_run{false};
};

}  // namespace sszgen
