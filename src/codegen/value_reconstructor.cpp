#include <sszgen/codegen/value_reconstructor.hpp>
#include <sszgen/common/critical.hpp>
#include <sszgen/common/overloaded.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <vector>

namespace sszgen::codegen {

namespace {

std::string_view trim_scalar(std::string_view text) {
  while (!text.empty() &&
         (std::isspace(static_cast<unsigned char>(text.front())) != 0 ||
          text.front() == '\'' || text.front() == '"')) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         (std::isspace(static_cast<unsigned char>(text.back())) != 0 ||
          text.back() == '\'' || text.back() == '"')) {
    text.remove_suffix(1);
  }
  return text;
}

bool is_decimal(const std::string_view text) {
  return !text.empty() && std::ranges::all_of(text, [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

// Both C++ literals and cpp_int parsing read a leading zero as octal.
std::string_view strip_leading_zeros(const std::string_view digits) {
  auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return digits.substr(digits.size() - 1);
  }
  return digits.substr(first);
}

std::string join(const std::vector<std::string>& parts) {
  auto out = std::string{};
  for (const auto& part : parts) {
    if (!out.empty()) {
      out += ", ";
    }
    out += part;
  }
  return out;
}

std::string render_byte_list(const common::bytes_t& bytes) {
  auto parts = std::vector<std::string>{};
  parts.reserve(bytes.size());
  for (const auto byte : bytes) {
    parts.push_back(fmt::format("{:#04x}", byte));
  }
  return join(parts);
}

common::bytes_t decode_prefixed_hex(const fixture::value_t& value,
                                    const std::string_view context) {
  auto text = trim_scalar(value.scalar(context));
  if (!text.starts_with("0x")) {
    common::critical("{}: expected a 0x-prefixed hex string, found '{}'",
                     context, text);
  }
  auto bytes = common::try_from_hex(text);
  if (!bytes.has_value()) {
    common::critical("{}: invalid hex string '{}'", context, text);
  }
  return *bytes;
}

std::string render_bool(const fixture::value_t& value,
                        const std::string_view context) {
  auto text = trim_scalar(value.scalar(context));
  if (text == "true" || text == "True") {
    return "true";
  }
  if (text == "false" || text == "False") {
    return "false";
  }
  common::critical("{}: expected a boolean, found '{}'", context, text);
}

// Unsigned literal with a suffix wide enough for the type, so values above
// INT64_MAX stay valid C++.
std::string render_uint_literal(const uint_t& type,
                                const fixture::value_t& value,
                                const std::string_view context) {
  auto text = trim_scalar(value.scalar(context));
  if (!is_decimal(text)) {
    common::critical("{}: expected a decimal integer, found '{}'", context,
                     text);
  }
  return fmt::format("{}{}", strip_leading_zeros(text),
                     type.bits > 32 ? "ull" : "u");
}

std::string render_element(const basic_type_t& element,
                           const fixture::value_t& value,
                           const std::string_view context) {
  return std::visit(
      common::overloaded{
          [&](const boolean_t&) { return render_bool(value, context); },
          [&](const uint_t& type) {
            if (type.is_wide()) {
              return render_wide_integer(type, value.scalar(context), context);
            }
            return render_uint_literal(type, value, context);
          }},
      element);
}

std::string render_sequence(const std::string& type,
                            const basic_type_t& element,
                            const fixture::value_t& value,
                            const std::string_view context) {
  auto parts = std::vector<std::string>{};
  auto index = std::size_t{0};
  for (const auto& item : value.sequence(context)) {
    parts.push_back(
        render_element(element, item, fmt::format("{}[{}]", context, index++)));
  }
  return fmt::format("{}::try_from(std::vector<{}>{{{}}}).value()", type,
                     render_type(element), join(parts));
}

const container_definition_t& container_named(const std::string_view name,
                                              const std::string_view context) {
  const auto* container = find_container(name);
  if (container == nullptr) {
    common::critical("{}: unknown container type '{}'", context, name);
  }
  return *container;
}

std::string to_lower(const std::string_view text) {
  auto out = std::string{text};
  std::ranges::transform(out, std::begin(out), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

common::bytes_t to_le_bytes(const std::string_view decimal,
                            const std::size_t width,
                            const std::string_view context) {
  auto text = trim_scalar(decimal);
  if (!is_decimal(text)) {
    common::critical("{}: expected a decimal integer, found '{}'", context,
                     text);
  }
  auto number =
      boost::multiprecision::cpp_int{std::string{strip_leading_zeros(text)}};
  auto bytes = common::bytes_t{};
  boost::multiprecision::export_bits(number, std::back_inserter(bytes), 8,
                                     false);
  if (bytes.size() > width) {
    common::critical("{}: value {} needs {} bytes, more than {}", context,
                     text, bytes.size(), width);
  }
  bytes.resize(width, 0);
  return bytes;
}

std::string render_wide_integer(const uint_t& type,
                                const std::string_view decimal,
                                const std::string_view context) {
  auto bytes = to_le_bytes(decimal, type.byte_width(), context);
  return fmt::format("{}::from_le_bytes(std::array<std::uint8_t, {}>{{{}}})",
                     render_type(basic_type_t{type}), type.byte_width(),
                     render_byte_list(bytes));
}

std::string render_container(const container_definition_t& container,
                             const fixture::value_t& value,
                             const std::string_view context) {
  auto fields = std::vector<std::pair<std::string, const fixture::value_t*>>{};
  for (const auto& [key, field_value] : value.mapping(context)) {
    auto name = to_lower(key);
    auto declared = std::ranges::any_of(
        container.fields, [&](const auto& field) { return field.name == name; });
    if (!declared) {
      common::critical("{}: {} has no field '{}'", context, container.name,
                       key);
    }
    auto duplicate = std::ranges::any_of(
        fields, [&](const auto& entry) { return entry.first == name; });
    if (duplicate) {
      common::critical("{}: field '{}' appears more than once", context, key);
    }
    fields.emplace_back(std::move(name), &field_value);
  }

  // Designated initializers must follow declaration order.
  auto parts = std::vector<std::string>{};
  for (const auto& field : container.fields) {
    auto found = std::ranges::find_if(
        fields, [&](const auto& entry) { return entry.first == field.name; });
    if (found == std::end(fields)) {
      common::critical("{}: {} is missing field '{}'", context, container.name,
                       field.name);
    }
    parts.push_back(fmt::format(
        ".{} = {}", field.name,
        render_value(field.type, *found->second,
                     fmt::format("{}.{}", context, field.name))));
  }
  return fmt::format("{}{{{}}}", container.name, join(parts));
}

std::string render_value(const type_descriptor_t& type,
                         const fixture::value_t& value,
                         const std::string_view context) {
  return std::visit(
      common::overloaded{
          [&](const boolean_t&) { return render_bool(value, context); },
          [&](const uint_t& scalar) {
            if (scalar.is_wide()) {
              return render_wide_integer(scalar, value.scalar(context),
                                         context);
            }
            return fmt::format("{}{{{}}}", render_type(type),
                               render_uint_literal(scalar, value, context));
          },
          [&](const vector_t& vector) {
            return render_sequence(render_type(type), vector.element, value,
                                   context);
          },
          [&](const list_t& list) {
            return render_sequence(render_type(type), list.element, value,
                                   context);
          },
          [&](const byte_list_t&) {
            return fmt::format(
                "{}::try_from(std::vector<std::uint8_t>{{{}}}).value()",
                render_type(type),
                render_byte_list(decode_prefixed_hex(value, context)));
          },
          [&](const bitlist_t&) {
            return fmt::format(
                "{}::try_from_bytes(std::vector<std::uint8_t>{{{}}}).value()",
                render_type(type),
                render_byte_list(decode_prefixed_hex(value, context)));
          },
          [&](const bitvector_t&) {
            return fmt::format(
                "{}::try_from_bytes(std::vector<std::uint8_t>{{{}}}).value()",
                render_type(type),
                render_byte_list(decode_prefixed_hex(value, context)));
          },
          [&](const container_t& container) {
            return render_container(container_named(container.name, context),
                                    value, context);
          },
          [&](const container_vector_t& vector) {
            const auto& container = container_named(vector.name, context);
            auto parts = std::vector<std::string>{};
            auto index = std::size_t{0};
            for (const auto& item : value.sequence(context)) {
              parts.push_back(render_container(
                  container, item, fmt::format("{}[{}]", context, index++)));
            }
            return fmt::format("{}::try_from(std::vector<{}>{{{}}}).value()",
                               render_type(type), vector.name, join(parts));
          }},
      type);
}

}  // namespace sszgen::codegen
