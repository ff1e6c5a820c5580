#include <sszgen/codegen/emitter.hpp>
#include <sszgen/driver.hpp>
#include <sszgen/fixture/loader.hpp>
#include <sszgen/output/artifact_mirror.hpp>
#include <sszgen/output/source_writer.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace sszgen {

std::filesystem::path output_path(const generator_config_t& config) {
  return config.target_dir /
         (std::string{fixture::to_string(config.category)} + "_test.cpp");
}

fixture::fixture_cases_t load_all_cases(const generator_config_t& config) {
  auto cases = fixture::fixture_cases_t{};
  fixture::load_cases(config.corpus_root, config.category,
                      fixture::format_t::valid, cases);
  fixture::load_cases(config.corpus_root, config.category,
                      fixture::format_t::invalid, cases);
  return cases;
}

void generate(const generator_config_t& config) {
  spdlog::info("Generating '{}' tests from '{}'",
               fixture::to_string(config.category),
               config.corpus_root.string());

  auto cases = load_all_cases(config);
  auto fragments = codegen::emit_source(config, cases);
  output::write_source(config, output_path(config), fragments);

  for (const auto& [name, test_case] : cases) {
    auto target = output::mirror_path(config, *test_case.data_path);
    output::copy_artifact(config, *test_case.data_path, target);
  }
  spdlog::info("Generated {} test(s) for '{}'{}", cases.size(),
               fixture::to_string(config.category),
               config.dry_run ? " (dry run)" : "");
}

}  // namespace sszgen
