#include <sszgen/codegen/containers.hpp>
#include <sszgen/codegen/emitter.hpp>
#include <sszgen/codegen/identifier.hpp>
#include <sszgen/codegen/type_descriptor.hpp>
#include <sszgen/codegen/value_reconstructor.hpp>
#include <sszgen/common/critical.hpp>
#include <sszgen/output/artifact_mirror.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <map>

namespace sszgen::codegen {

namespace {

std::string quote(const std::string_view text) {
  auto out = std::string{"\""};
  for (const auto c : text) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string emit_valid_case(const std::string_view suite,
                            const std::string& identifier,
                            const std::string& type,
                            const std::string& value,
                            const std::optional<std::string>& root,
                            const std::string_view data_path) {
  auto source = fmt::format(R"(
TEST({suite}, {identifier}) {{
  using value_t = {type};
  const value_t value = {value};
  auto encoding = serialize(value);
  auto expected_encoding = read_ssz_snappy_from_test_data({path});
  EXPECT_EQ(encoding, expected_encoding);

  auto recovered_value = deserialize<value_t>(expected_encoding);
  EXPECT_EQ(recovered_value, value);
)",
                            fmt::arg("suite", suite),
                            fmt::arg("identifier", identifier),
                            fmt::arg("type", type), fmt::arg("value", value),
                            fmt::arg("path", quote(data_path)));
  if (root.has_value()) {
    source += fmt::format(R"(
  auto root = hash_tree_root(value);
  auto expected_root = root_from_hex({root});
  EXPECT_EQ(root, expected_root);
)",
                          fmt::arg("root", quote(*root)));
  }
  source += "}\n";
  return source;
}

std::string emit_invalid_case(const std::string_view suite,
                              const std::string& identifier,
                              const std::string& type,
                              const std::string_view data_path) {
  return fmt::format(R"(
TEST({suite}, {identifier}) {{
  using value_t = {type};
  auto encoding = read_ssz_snappy_from_test_data({path});

  EXPECT_ANY_THROW(static_cast<void>(deserialize<value_t>(encoding)));
}}
)",
                     fmt::arg("suite", suite),
                     fmt::arg("identifier", identifier), fmt::arg("type", type),
                     fmt::arg("path", quote(data_path)));
}

}  // namespace

std::string emit_case(const fixture::category_t category,
                      const std::string_view name,
                      const fixture::fixture_case_t& test_case,
                      const std::string_view data_path) {
  auto type = resolve_type(category, name);
  auto rendered_type = render_type(type);
  auto identifier = to_snake_case(name);
  auto suite = fixture::to_string(category);
  spdlog::debug("Case '{}' resolves to {}", name, rendered_type);

  switch (test_case.format) {
    case fixture::format_t::valid: {
      if (!test_case.value.has_value()) {
        common::critical("Valid case '{}' has no value", name);
      }
      auto value = render_value(type, *test_case.value, name);
      return emit_valid_case(suite, identifier, rendered_type, value,
                             test_case.root, data_path);
    }
    case fixture::format_t::invalid:
      return emit_invalid_case(suite, identifier, rendered_type, data_path);
  }
  common::critical("Case '{}' has an unknown format", name);
}

std::vector<std::string> emit_source(const generator_config_t& config,
                                     const fixture::fixture_cases_t& cases) {
  auto fragments = std::vector<std::string>{std::string{kSourcePreamble}};
  if (config.category == fixture::category_t::containers) {
    for (const auto& container : exemplar_containers()) {
      fragments.push_back(render_definition(container));
    }
  }

  auto identifiers = std::map<std::string, std::string>{};
  for (const auto& [name, test_case] : cases) {
    auto [existing, inserted] =
        identifiers.emplace(to_snake_case(name), name);
    if (!inserted) {
      common::critical("Cases '{}' and '{}' map to the same test name '{}'",
                       existing->second, name, existing->first);
    }
    if (!test_case.data_path.has_value()) {
      common::critical("Case '{}' has no payload", name);
    }
    auto target = output::mirror_path(config, *test_case.data_path);
    fragments.push_back(emit_case(config.category, name, test_case,
                                  output::project_path(config, target)));
  }
  return fragments;
}

}  // namespace sszgen::codegen
