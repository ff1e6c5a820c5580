#pragma once

#include <sszgen/fixture/value.hpp>

#include <filesystem>
#include <string_view>

namespace sszgen::yaml {

/// YAML front end, specialized per parsing library.
///
/// Documents are converted to `fixture::value_t` right away so nothing
/// downstream depends on the library's node types.
template <typename Library>
struct document {
  /// Parse `text`; `origin` names the source in error messages.
  fixture::value_t parse(std::string_view text, std::string_view origin);

  /// Read and parse the file at `path`. Unreadable files are fatal.
  fixture::value_t load(const std::filesystem::path& path);
};

}  // namespace sszgen::yaml
