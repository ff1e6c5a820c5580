#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sszgen::fixture {

/// Schema-less value read from a fixture YAML document.
///
/// Scalars keep their unquoted text; typing happens later, when the value
/// is reconstructed against a type descriptor. Mapping entries keep file
/// order.
struct value_t final {
  using scalar_t = std::string;
  using sequence_t = std::vector<value_t>;
  using mapping_t = std::vector<std::pair<std::string, value_t>>;

  std::variant<scalar_t, sequence_t, mapping_t> data;

  bool is_scalar() const { return std::holds_alternative<scalar_t>(data); }
  bool is_sequence() const { return std::holds_alternative<sequence_t>(data); }
  bool is_mapping() const { return std::holds_alternative<mapping_t>(data); }

  /// Return the scalar text; fatal when the node is not a scalar.
  const scalar_t& scalar(std::string_view context) const;

  /// Return the children; fatal when the node is not a sequence.
  const sequence_t& sequence(std::string_view context) const;

  /// Return the entries; fatal when the node is not a mapping.
  const mapping_t& mapping(std::string_view context) const;

  /// First entry named `key`, if this is a mapping that has one.
  const value_t* find(std::string_view key) const;

  static value_t make_scalar(std::string text);
  static value_t make_sequence(sequence_t items);
  static value_t make_mapping(mapping_t entries);

  bool operator==(const value_t&) const = default;
};

std::string_view kind_of(const value_t& value);

}  // namespace sszgen::fixture
