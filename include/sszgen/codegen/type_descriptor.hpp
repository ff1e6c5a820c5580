#pragma once

#include <sszgen/fixture/category.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sszgen::codegen {

/// Bitlist bound used when a case name declares none (`bitlist_no_...`).
inline constexpr auto kDefaultBitlistBound = std::size_t{256};

struct boolean_t final {
  bool operator==(const boolean_t&) const = default;
};

/// Unsigned integer of `bits` width. 128 and 256 bits are wide integers
/// provided by the consumer library; the rest are `std::uintN_t`.
struct uint_t final {
  uint16_t bits{};

  bool is_wide() const { return bits > 64; }
  std::size_t byte_width() const { return bits / 8u; }

  bool operator==(const uint_t&) const = default;
};

using basic_type_t = std::variant<boolean_t, uint_t>;

/// Fixed-length vector of a basic type.
struct vector_t final {
  basic_type_t element;
  std::size_t length{};

  bool operator==(const vector_t&) const = default;
};

/// Bounded list of a basic type.
struct list_t final {
  basic_type_t element;
  std::size_t bound{};

  bool operator==(const list_t&) const = default;
};

/// Bounded list of bytes; fixtures write its value as one hex string.
struct byte_list_t final {
  std::size_t bound{};

  bool operator==(const byte_list_t&) const = default;
};

struct bitlist_t final {
  std::size_t bound{};

  bool operator==(const bitlist_t&) const = default;
};

struct bitvector_t final {
  std::size_t length{};

  bool operator==(const bitvector_t&) const = default;
};

/// One of the exemplar containers, by type name.
struct container_t final {
  std::string name;

  bool operator==(const container_t&) const = default;
};

/// Fixed-length vector of an exemplar container.
struct container_vector_t final {
  std::string name;
  std::size_t length{};

  bool operator==(const container_vector_t&) const = default;
};

using type_descriptor_t = std::variant<boolean_t,
                                       uint_t,
                                       vector_t,
                                       list_t,
                                       byte_list_t,
                                       bitlist_t,
                                       bitvector_t,
                                       container_t,
                                       container_vector_t>;

/// Derive the type of a fixture case from its category and name.
///
/// Malformed names are fatal.
type_descriptor_t resolve_type(fixture::category_t category,
                               std::string_view case_name);

/// Parse an element tag such as `bool`, `uint16` or `uint256`.
basic_type_t parse_element_type(std::string_view tag,
                                std::string_view case_name);

/// C++ spelling of the type in the consumer library's grammar.
std::string render_type(const type_descriptor_t& type);
std::string render_type(const basic_type_t& type);

}  // namespace sszgen::codegen
