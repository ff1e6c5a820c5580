#pragma once

#include <sszgen/codegen/type_descriptor.hpp>

#include <string>
#include <string_view>
#include <vector>

// Exemplar containers of the ssz_generic `containers` suite.
//
// Each field carries the descriptor that drives both its declaration in the
// generated test source and the reconstruction of its fixture value, so a
// new container is a new table entry.
namespace sszgen::codegen {

struct field_t final {
  std::string name;
  type_descriptor_t type;
};

struct container_definition_t final {
  std::string name;
  std::vector<field_t> fields;
};

/// All exemplar containers, each after the containers it embeds.
const std::vector<container_definition_t>& exemplar_containers();

/// Exemplar container named `name`, or nullptr.
const container_definition_t* find_container(std::string_view name);

/// C++ declaration of `container` for the generated test source.
std::string render_definition(const container_definition_t& container);

}  // namespace sszgen::codegen
