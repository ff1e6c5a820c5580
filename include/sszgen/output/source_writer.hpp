#pragma once

#include <sszgen/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace sszgen::output {

/// Write the generated source unit to `path`, replacing any older file.
///
/// In dry-run mode the fragments go to stdout instead.
void write_source(const generator_config_t& config,
                  const std::filesystem::path& path,
                  const std::vector<std::string>& fragments);

}  // namespace sszgen::output
