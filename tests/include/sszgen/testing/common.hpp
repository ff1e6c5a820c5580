#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sszgen/fixture/category.hpp>
#include <sszgen/fixture/value.hpp>
#include <sszgen/yaml/ryml/document.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace sszgen::testing {

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline void write_file(const std::filesystem::path& path,
                       const std::string_view content) {
  std::filesystem::create_directories(path.parent_path());
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  output.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
  auto input = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{input},
                     std::istreambuf_iterator<char>{}};
}

/// Write `{corpus}/{category}/{format}/{name}/` with the given files; the
/// payload is always written.
inline std::filesystem::path write_case(
    const std::filesystem::path& corpus,
    const fixture::category_t category,
    const fixture::format_t format,
    const std::string_view name,
    const std::optional<std::string_view> meta,
    const std::optional<std::string_view> value,
    const std::string_view payload = std::string_view{"\x01\x02\x03", 3}) {
  auto directory = corpus / std::string{fixture::to_string(category)} /
                   std::string{fixture::to_string(format)} / std::string{name};
  if (meta.has_value()) {
    write_file(directory / "meta.yaml", *meta);
  }
  if (value.has_value()) {
    write_file(directory / "value.yaml", *value);
  }
  write_file(directory / "serialized.ssz_snappy", payload);
  return directory;
}

inline fixture::value_t parse_yaml(const std::string_view text) {
  return yaml::document_t{}.parse(text, "inline");
}

/// Death tests match against stderr; the default spdlog logger writes to
/// stdout.
inline void log_to_stderr() {
  spdlog::set_default_logger(std::make_shared<spdlog::logger>(
      "sszgen_test", std::make_shared<spdlog::sinks::stderr_color_sink_st>()));
}

}  // namespace sszgen::testing
