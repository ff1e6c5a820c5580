#include <sszgen/common/critical.hpp>
#include <sszgen/output/source_writer.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <system_error>

namespace sszgen::output {

void write_source(const generator_config_t& config,
                  const std::filesystem::path& path,
                  const std::vector<std::string>& fragments) {
  if (config.dry_run) {
    for (const auto& fragment : fragments) {
      std::cout << fragment << '\n';
    }
    std::cout.flush();
    return;
  }

  if (path.has_parent_path()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(path.parent_path(), error);
    if (error) {
      spdlog::error("Failed creating directory '{}': {}",
                    path.parent_path().string(), error.message());
      common::critical("Failed creating output directory");
    }
  }

  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!output.good()) {
    spdlog::error("Failed opening output '{}'", path.string());
    common::critical("Failed opening generated source file");
  }
  for (const auto& fragment : fragments) {
    output.write(fragment.data(), static_cast<std::streamsize>(fragment.size()));
  }
  output.flush();
  if (!output.good()) {
    spdlog::error("Failed writing output '{}'", path.string());
    common::critical("Failed writing generated source file");
  }
  spdlog::info("Wrote '{}'", path.string());
}

}  // namespace sszgen::output
