#pragma once

#include <sszgen/config.hpp>
#include <sszgen/fixture/fixture_case.hpp>

#include <filesystem>

namespace sszgen {

/// `{target_dir}/{category}_test.cpp`.
std::filesystem::path output_path(const generator_config_t& config);

/// Load the valid and then the invalid cases of the configured category.
fixture::fixture_cases_t load_all_cases(const generator_config_t& config);

/// One complete run: load, emit, write the source, mirror the payloads.
///
/// The source is written before the payloads are copied; any failure on
/// the way terminates the process.
void generate(const generator_config_t& config);

}  // namespace sszgen
