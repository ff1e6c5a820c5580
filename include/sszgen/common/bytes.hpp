#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sszgen::common {

using bytes_t = std::vector<uint8_t>;

/// Remove a leading `0x`/`0X` if present.
std::string_view strip_hex_prefix(std::string_view input);

/// Decode an (optionally `0x`-prefixed) hex string.
///
/// Metadata roots are checked with it, and byte lists and bit sequences
/// are decoded with it before they are rendered as byte literals.
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace sszgen::common
