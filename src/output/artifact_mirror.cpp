#include <sszgen/common/critical.hpp>
#include <sszgen/output/artifact_mirror.hpp>

#include <spdlog/spdlog.h>

#include <system_error>

namespace sszgen::output {

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
  auto out = path.lexically_normal();
  if (!out.has_filename() && out.has_parent_path()) {
    out = out.parent_path();
  }
  return out;
}

}  // namespace

std::filesystem::path mirror_path(const generator_config_t& config,
                                  const std::filesystem::path& data_path) {
  auto relative =
      normalized(data_path).lexically_relative(normalized(config.corpus_root));
  if (relative.empty() || *relative.begin() == "..") {
    common::critical("Payload '{}' is outside the corpus root '{}'",
                     data_path.string(), config.corpus_root.string());
  }
  return normalized(config.target_dir) / "data" / relative;
}

std::string project_path(const generator_config_t& config,
                         const std::filesystem::path& target) {
  auto relative =
      normalized(target).lexically_relative(normalized(config.project_root));
  if (relative.empty()) {
    common::critical("Cannot express '{}' relative to project root '{}'",
                     target.string(), config.project_root.string());
  }
  return relative.generic_string();
}

void copy_artifact(const generator_config_t& config,
                   const std::filesystem::path& source,
                   const std::filesystem::path& target) {
  if (config.dry_run) {
    spdlog::info("moving files from {} to {}", source.string(),
                 target.string());
    return;
  }

  auto error = std::error_code{};
  std::filesystem::create_directories(target.parent_path(), error);
  if (error) {
    spdlog::error("Failed creating directory '{}': {}",
                  target.parent_path().string(), error.message());
    common::critical("Failed creating test data directory");
  }
  std::filesystem::copy_file(
      source, target, std::filesystem::copy_options::overwrite_existing, error);
  if (error) {
    spdlog::error("Failed copying '{}' to '{}': {}", source.string(),
                  target.string(), error.message());
    common::critical("Failed copying test data");
  }
  spdlog::debug("Copied '{}' to '{}'", source.string(), target.string());
}

}  // namespace sszgen::output
