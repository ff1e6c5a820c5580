#include <sszgen/common/bytes.hpp>
#include <sszgen/common/critical.hpp>
#include <sszgen/fixture/loader.hpp>
#include <sszgen/yaml/ryml/document.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <system_error>
#include <vector>

namespace sszgen::fixture {

namespace {

std::vector<std::filesystem::path> sorted_children(
    const std::filesystem::path& directory) {
  auto error = std::error_code{};
  auto iterator = std::filesystem::directory_iterator{directory, error};
  if (error) {
    spdlog::error("Failed listing directory '{}': {}", directory.string(),
                  error.message());
    common::critical("Failed listing fixture directory");
  }
  auto children = std::vector<std::filesystem::path>{};
  for (const auto& entry : iterator) {
    children.push_back(entry.path());
  }
  std::ranges::sort(children);
  return children;
}

std::string read_root(const value_t& meta, const std::filesystem::path& path) {
  const auto* root = meta.find("root");
  if (root == nullptr || !root->is_scalar()) {
    common::critical("Metadata '{}' has no 'root' string", path.string());
  }
  const auto& text = root->scalar(path.string());
  if (!common::try_from_hex(text).has_value()) {
    common::critical("Metadata '{}' has a malformed root '{}'", path.string(),
                     text);
  }
  return text;
}

}  // namespace

std::filesystem::path suite_path(const std::filesystem::path& corpus_root,
                                 const category_t category,
                                 const format_t format) {
  return corpus_root / std::string{to_string(category)} /
         std::string{to_string(format)};
}

void load_case(const std::filesystem::path& case_directory,
               const format_t format,
               fixture_cases_t& cases) {
  auto document = yaml::document_t{};
  auto name = case_directory.filename().string();
  auto& test_case = cases[name];
  test_case.format = format;

  for (const auto& path : sorted_children(case_directory)) {
    auto part_name = path.filename().string();
    if (part_name.find("meta") != std::string::npos) {
      test_case.root = read_root(document.load(path), path);
    } else if (part_name.find("value") != std::string::npos) {
      test_case.value = document.load(path);
    } else if (part_name.find("ssz_snappy") != std::string::npos) {
      test_case.data_path = path;
    } else {
      common::critical("Unexpected file '{}' in fixture case '{}'",
                       path.string(), name);
    }
  }

  if (!test_case.data_path.has_value()) {
    common::critical("Fixture case '{}' has no ssz_snappy payload",
                     case_directory.string());
  }
  spdlog::debug("Loaded {} case '{}' (root: {}, value: {})", to_string(format),
                name, test_case.root.has_value(), test_case.value.has_value());
}

void load_cases(const std::filesystem::path& corpus_root,
                const category_t category,
                const format_t format,
                fixture_cases_t& cases) {
  auto directory = suite_path(corpus_root, category, format);
  if (!std::filesystem::is_directory(directory)) {
    common::critical("Fixture suite '{}' is not a directory",
                     directory.string());
  }
  auto before = cases.size();
  for (const auto& case_directory : sorted_children(directory)) {
    load_case(case_directory, format, cases);
  }
  spdlog::info("Loaded {} {} case(s) from '{}'", cases.size() - before,
               to_string(format), directory.string());
}

}  // namespace sszgen::fixture
