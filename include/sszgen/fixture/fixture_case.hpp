#pragma once

#include <sszgen/fixture/category.hpp>
#include <sszgen/fixture/value.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace sszgen::fixture {

/// One test vector directory of the corpus.
///
/// Valid cases carry a value tree and usually a root; invalid cases only
/// carry the payload.
struct fixture_case_t final {
  // hash tree root from `meta.yaml`, as written in the corpus
  std::optional<std::string> root;
  std::optional<value_t> value;
  std::optional<std::filesystem::path> data_path;
  format_t format{format_t::valid};
};

/// Cases of one category keyed by directory name; emission follows key
/// order.
using fixture_cases_t = std::map<std::string, fixture_case_t>;

}  // namespace sszgen::fixture
