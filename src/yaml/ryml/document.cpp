#include <sszgen/common/critical.hpp>
#include <sszgen/yaml/ryml/document.hpp>

#include <ryml.hpp>
#include <ryml_std.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <string>

namespace sszgen::yaml {

namespace {

std::string to_std_string(const ryml::csubstr text) {
  return std::string(text.begin(), text.end());
}

[[noreturn]] void on_parse_error(const char* message,
                                 size_t length,
                                 ryml::Location location,
                                 void* /*user_data*/) {
  common::critical("YAML error in '{}' at line {}: {}",
                   std::string_view{location.name.str, location.name.len},
                   location.line, std::string_view{message, length});
}

fixture::value_t convert(const ryml::ConstNodeRef node,
                         const std::string_view origin) {
  if (node.is_map()) {
    auto entries = fixture::value_t::mapping_t{};
    entries.reserve(node.num_children());
    for (const ryml::ConstNodeRef child : node.children()) {
      if (!child.has_key()) {
        common::critical("YAML mapping entry without a key in '{}'", origin);
      }
      entries.emplace_back(to_std_string(child.key()), convert(child, origin));
    }
    return fixture::value_t::make_mapping(std::move(entries));
  }
  if (node.is_seq()) {
    auto items = fixture::value_t::sequence_t{};
    items.reserve(node.num_children());
    for (const ryml::ConstNodeRef child : node.children()) {
      items.push_back(convert(child, origin));
    }
    return fixture::value_t::make_sequence(std::move(items));
  }
  if (node.has_val()) {
    return fixture::value_t::make_scalar(to_std_string(node.val()));
  }
  common::critical("Unsupported YAML node in '{}'", origin);
}

}  // namespace

document<ryml_tag>::document() {
  ryml::set_callbacks(
      ryml::Callbacks{nullptr, nullptr, nullptr, &on_parse_error});
}

fixture::value_t document<ryml_tag>::parse(const std::string_view text,
                                           const std::string_view origin) {
  auto tree = ryml::parse_in_arena(ryml::csubstr{origin.data(), origin.size()},
                                   ryml::csubstr{text.data(), text.size()});
  auto root = tree.crootref();
  if (root.is_stream()) {
    if (root.num_children() != 1) {
      common::critical("Expected exactly one YAML document in '{}'", origin);
    }
    root = root.first_child();
  }
  return convert(root, origin);
}

fixture::value_t document<ryml_tag>::load(const std::filesystem::path& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    spdlog::error("Failed opening YAML file '{}'", path.string());
    common::critical("Failed opening YAML file");
  }
  auto text = std::string{std::istreambuf_iterator<char>{input},
                          std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    spdlog::error("Failed reading YAML file '{}'", path.string());
    common::critical("Failed reading YAML file");
  }
  return parse(text, path.string());
}

}  // namespace sszgen::yaml
