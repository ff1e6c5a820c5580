#pragma once

#include <sszgen/config.hpp>

#include <filesystem>
#include <string>

namespace sszgen::output {

/// `{target_dir}/data/{path of data_path inside the corpus}`.
///
/// Fatal when `data_path` does not lie under the corpus root.
std::filesystem::path mirror_path(const generator_config_t& config,
                                  const std::filesystem::path& data_path);

/// `target` relative to the project root, with forward slashes; this is
/// the string the generated test passes to the payload reader.
std::string project_path(const generator_config_t& config,
                         const std::filesystem::path& target);

/// Copy one payload, creating parent directories and replacing an older
/// copy. In dry-run mode the copy is only logged.
void copy_artifact(const generator_config_t& config,
                   const std::filesystem::path& source,
                   const std::filesystem::path& target);

}  // namespace sszgen::output
