#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Fixture categories of the ssz_generic corpus and the valid/invalid split
// under each of them. The string forms are corpus directory names.
namespace sszgen::fixture {

enum class category_t : uint8_t {
  basic_vector = 0,
  bitlist = 1,
  bitvector = 2,
  boolean = 3,
  containers = 4,
  uints = 5
};

enum class format_t : uint8_t { valid = 0, invalid = 1 };

inline constexpr auto kCategoryMappings = std::array{
    std::pair<std::string_view, category_t>{"basic_vector",
                                            category_t::basic_vector},
    std::pair<std::string_view, category_t>{"bitlist", category_t::bitlist},
    std::pair<std::string_view, category_t>{"bitvector",
                                            category_t::bitvector},
    std::pair<std::string_view, category_t>{"boolean", category_t::boolean},
    std::pair<std::string_view, category_t>{"containers",
                                            category_t::containers},
    std::pair<std::string_view, category_t>{"uints", category_t::uints},
};

inline constexpr auto kFormatMappings = std::array{
    std::pair<std::string_view, format_t>{"valid", format_t::valid},
    std::pair<std::string_view, format_t>{"invalid", format_t::invalid},
};

namespace detail {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup(
    const std::string_view name,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [candidate, value] : mappings) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, candidate] : mappings) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace detail

inline constexpr std::optional<category_t> try_parse_category(
    const std::string_view token) {
  return detail::lookup(token, kCategoryMappings);
}

inline constexpr std::string_view to_string(const category_t value) {
  return detail::name_of(value, kCategoryMappings);
}

inline constexpr std::string_view to_string(const format_t value) {
  return detail::name_of(value, kFormatMappings);
}

}  // namespace sszgen::fixture
