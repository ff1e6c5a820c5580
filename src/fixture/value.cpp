#include <sszgen/common/critical.hpp>
#include <sszgen/fixture/value.hpp>

namespace sszgen::fixture {

const value_t::scalar_t& value_t::scalar(const std::string_view context) const {
  if (const auto* text = std::get_if<scalar_t>(&data)) {
    return *text;
  }
  common::critical("{}: expected a scalar, found a {}", context,
                   kind_of(*this));
}

const value_t::sequence_t& value_t::sequence(
    const std::string_view context) const {
  if (const auto* items = std::get_if<sequence_t>(&data)) {
    return *items;
  }
  common::critical("{}: expected a sequence, found a {}", context,
                   kind_of(*this));
}

const value_t::mapping_t& value_t::mapping(
    const std::string_view context) const {
  if (const auto* entries = std::get_if<mapping_t>(&data)) {
    return *entries;
  }
  common::critical("{}: expected a mapping, found a {}", context,
                   kind_of(*this));
}

const value_t* value_t::find(const std::string_view key) const {
  const auto* entries = std::get_if<mapping_t>(&data);
  if (entries == nullptr) {
    return nullptr;
  }
  for (const auto& [name, value] : *entries) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

value_t value_t::make_scalar(std::string text) {
  return value_t{.data = std::move(text)};
}

value_t value_t::make_sequence(sequence_t items) {
  return value_t{.data = std::move(items)};
}

value_t value_t::make_mapping(mapping_t entries) {
  return value_t{.data = std::move(entries)};
}

std::string_view kind_of(const value_t& value) {
  if (value.is_scalar()) {
    return "scalar";
  }
  if (value.is_sequence()) {
    return "sequence";
  }
  return "mapping";
}

}  // namespace sszgen::fixture
