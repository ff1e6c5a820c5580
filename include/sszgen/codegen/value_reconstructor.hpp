#pragma once

#include <sszgen/codegen/containers.hpp>
#include <sszgen/codegen/type_descriptor.hpp>
#include <sszgen/common/bytes.hpp>
#include <sszgen/fixture/value.hpp>

#include <string>
#include <string_view>

namespace sszgen::codegen {

/// Render `value` as a C++ expression of type `type`.
///
/// `context` names the case (and field path) in error messages. Values
/// that do not fit the shape the type expects are fatal; integer ranges
/// are left to the compiler of the generated source.
std::string render_value(const type_descriptor_t& type,
                         const fixture::value_t& value,
                         std::string_view context);

/// Little-endian bytes of a decimal integer, zero padded to `width`.
///
/// Fatal when `decimal` is not a non-negative base-10 integer or needs
/// more than `width` bytes.
common::bytes_t to_le_bytes(std::string_view decimal,
                            std::size_t width,
                            std::string_view context);

/// `from_le_bytes` construction of a wide integer from its decimal text.
std::string render_wide_integer(const uint_t& type,
                                std::string_view decimal,
                                std::string_view context);

/// Designated-initializer construction of an exemplar container.
///
/// Keys are lower-cased; each declared field must appear exactly once.
std::string render_container(const container_definition_t& container,
                             const fixture::value_t& value,
                             std::string_view context);

}  // namespace sszgen::codegen
