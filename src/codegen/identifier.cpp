#include <sszgen/codegen/identifier.hpp>

#include <cctype>

namespace sszgen::codegen {

namespace {

bool is_upper(const char c) {
  return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(const char c) {
  return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string to_snake_case(const std::string_view name) {
  auto out = std::string{};
  out.reserve(name.size() + 8);
  auto pending_break = false;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto c = name[i];
    if (!is_alnum(c)) {
      pending_break = true;
      continue;
    }
    if (is_upper(c) && i > 0) {
      const auto previous = name[i - 1];
      const auto next_is_lower = (i + 1) < name.size() && is_lower(name[i + 1]);
      if (is_lower(previous) || std::isdigit(static_cast<unsigned char>(
                                    previous)) != 0 ||
          (is_upper(previous) && next_is_lower)) {
        pending_break = true;
      }
    }
    if (pending_break && !out.empty()) {
      out.push_back('_');
    }
    pending_break = false;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace sszgen::codegen
