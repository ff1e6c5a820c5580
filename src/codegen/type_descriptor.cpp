#include <sszgen/codegen/containers.hpp>
#include <sszgen/codegen/type_descriptor.hpp>
#include <sszgen/common/critical.hpp>
#include <sszgen/common/overloaded.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <vector>

namespace sszgen::codegen {

namespace {

inline constexpr auto kSupportedWidths =
    std::array<uint16_t, 6>{8, 16, 32, 64, 128, 256};

std::vector<std::string_view> split_name(std::string_view name) {
  auto parts = std::vector<std::string_view>{};
  while (true) {
    auto separator = name.find('_');
    parts.push_back(name.substr(0, separator));
    if (separator == std::string_view::npos) {
      break;
    }
    name.remove_prefix(separator + 1);
  }
  return parts;
}

std::optional<std::size_t> parse_number(const std::string_view token) {
  auto value = std::size_t{};
  const auto* end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), end, value);
  if (token.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::string_view token_at(const std::vector<std::string_view>& parts,
                          const std::size_t index,
                          const std::string_view case_name) {
  if (index >= parts.size()) {
    common::critical("Case name '{}' is missing token {}", case_name, index);
  }
  return parts[index];
}

std::size_t numeric_token(const std::vector<std::string_view>& parts,
                          const std::size_t index,
                          const std::string_view case_name) {
  auto token = token_at(parts, index, case_name);
  auto value = parse_number(token);
  if (!value.has_value()) {
    common::critical("Case name '{}' has non-numeric bound '{}'", case_name,
                     token);
  }
  return *value;
}

uint_t make_uint(const std::size_t bits, const std::string_view case_name) {
  if (std::ranges::find(kSupportedWidths, bits) == std::end(kSupportedWidths)) {
    common::critical("Case name '{}' uses unsupported integer width {}",
                     case_name, bits);
  }
  return uint_t{.bits = static_cast<uint16_t>(bits)};
}

}  // namespace

basic_type_t parse_element_type(const std::string_view tag,
                                const std::string_view case_name) {
  if (tag == "bool") {
    return boolean_t{};
  }
  if (!tag.starts_with("uint")) {
    common::critical("Case name '{}' has unknown element type '{}'", case_name,
                     tag);
  }
  auto bits = parse_number(tag.substr(4));
  if (!bits.has_value()) {
    common::critical("Case name '{}' has unknown element type '{}'", case_name,
                     tag);
  }
  return make_uint(*bits, case_name);
}

type_descriptor_t resolve_type(const fixture::category_t category,
                               const std::string_view case_name) {
  auto parts = split_name(case_name);
  switch (category) {
    case fixture::category_t::basic_vector: {
      auto element =
          parse_element_type(token_at(parts, 1, case_name), case_name);
      return vector_t{.element = element,
                      .length = numeric_token(parts, 2, case_name)};
    }
    case fixture::category_t::bitlist: {
      if (token_at(parts, 1, case_name) == "no") {
        return bitlist_t{.bound = kDefaultBitlistBound};
      }
      return bitlist_t{.bound = numeric_token(parts, 1, case_name)};
    }
    case fixture::category_t::bitvector:
      return bitvector_t{.length = numeric_token(parts, 1, case_name)};
    case fixture::category_t::boolean:
      return boolean_t{};
    case fixture::category_t::containers: {
      auto name = token_at(parts, 0, case_name);
      if (find_container(name) == nullptr) {
        common::critical("Case name '{}' names no known container", case_name);
      }
      return container_t{.name = std::string{name}};
    }
    case fixture::category_t::uints: {
      auto width = token_at(parts, 1, case_name);
      if (width.find("256") != std::string_view::npos) {
        return uint_t{.bits = 256};
      }
      return make_uint(numeric_token(parts, 1, case_name), case_name);
    }
  }
  common::critical("Unsupported fixture category for case '{}'", case_name);
}

std::string render_type(const basic_type_t& type) {
  return std::visit(
      common::overloaded{
          [](const boolean_t&) { return std::string{"bool"}; },
          [](const uint_t& value) {
            if (value.is_wide()) {
              return fmt::format("ssz::uint{}", value.bits);
            }
            return fmt::format("std::uint{}_t", value.bits);
          }},
      type);
}

std::string render_type(const type_descriptor_t& type) {
  return std::visit(
      common::overloaded{
          [](const boolean_t& value) {
            return render_type(basic_type_t{value});
          },
          [](const uint_t& value) { return render_type(basic_type_t{value}); },
          [](const vector_t& value) {
            return fmt::format("ssz::vector<{}, {}>",
                               render_type(value.element), value.length);
          },
          [](const list_t& value) {
            return fmt::format("ssz::list<{}, {}>", render_type(value.element),
                               value.bound);
          },
          [](const byte_list_t& value) {
            return fmt::format("ssz::list<std::uint8_t, {}>", value.bound);
          },
          [](const bitlist_t& value) {
            return fmt::format("ssz::bitlist<{}>", value.bound);
          },
          [](const bitvector_t& value) {
            return fmt::format("ssz::bitvector<{}>", value.length);
          },
          [](const container_t& value) { return value.name; },
          [](const container_vector_t& value) {
            return fmt::format("ssz::vector<{}, {}>", value.name, value.length);
          }},
      type);
}

}  // namespace sszgen::codegen
