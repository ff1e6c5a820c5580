#pragma once

#include <sszgen/fixture/value.hpp>
#include <sszgen/yaml/document.hpp>

#include <filesystem>
#include <string_view>

namespace sszgen::yaml {

struct ryml_tag {};

template <>
struct document<ryml_tag> final {
  /// Installs the rapidyaml error callback that routes parse errors to
  /// `common::critical`.
  document();

  fixture::value_t parse(std::string_view text, std::string_view origin);
  fixture::value_t load(const std::filesystem::path& path);
};

using document_t = document<ryml_tag>;

}  // namespace sszgen::yaml
