#include <sszgen/codegen/containers.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace sszgen::codegen {

namespace {

std::vector<container_definition_t> make_exemplar_containers() {
  auto u8 = uint_t{.bits = 8};
  auto u16 = uint_t{.bits = 16};
  auto u32 = uint_t{.bits = 32};
  auto u64 = uint_t{.bits = 64};

  return {
      container_definition_t{.name = "SingleFieldTestStruct",
                             .fields = {{"a", u8}}},
      container_definition_t{.name = "SmallTestStruct",
                             .fields = {{"a", u16}, {"b", u16}}},
      container_definition_t{.name = "FixedTestStruct",
                             .fields = {{"a", u8}, {"b", u64}, {"c", u32}}},
      container_definition_t{
          .name = "VarTestStruct",
          .fields = {{"a", u16},
                     {"b", list_t{.element = u16, .bound = 1024}},
                     {"c", u8}}},
      container_definition_t{
          .name = "ComplexTestStruct",
          .fields = {{"a", u16},
                     {"b", list_t{.element = u16, .bound = 128}},
                     {"c", u8},
                     {"d", byte_list_t{.bound = 256}},
                     {"e", container_t{.name = "VarTestStruct"}},
                     {"f", container_vector_t{.name = "FixedTestStruct",
                                              .length = 4}},
                     {"g", container_vector_t{.name = "VarTestStruct",
                                              .length = 2}}}},
      container_definition_t{.name = "BitsStruct",
                             .fields = {{"a", bitlist_t{.bound = 5}},
                                        {"b", bitvector_t{.length = 2}},
                                        {"c", bitvector_t{.length = 1}},
                                        {"d", bitlist_t{.bound = 6}},
                                        {"e", bitvector_t{.length = 8}}}},
  };
}

}  // namespace

const std::vector<container_definition_t>& exemplar_containers() {
  static const auto containers = make_exemplar_containers();
  return containers;
}

const container_definition_t* find_container(const std::string_view name) {
  const auto& containers = exemplar_containers();
  auto found = std::ranges::find_if(
      containers, [&](const auto& container) { return container.name == name; });
  if (found == std::end(containers)) {
    return nullptr;
  }
  return &*found;
}

std::string render_definition(const container_definition_t& container) {
  auto out = fmt::format("\nstruct {} {{\n", container.name);
  auto names = std::string{};
  for (const auto& field : container.fields) {
    out += fmt::format("  {} {}{{}};\n", render_type(field.type), field.name);
    names += fmt::format(", {}", field.name);
  }
  out += fmt::format("\n  bool operator==(const {}&) const = default;\n}};\n",
                     container.name);
  out += fmt::format("SSZ_CONTAINER({}{});\n", container.name, names);
  return out;
}

}  // namespace sszgen::codegen
