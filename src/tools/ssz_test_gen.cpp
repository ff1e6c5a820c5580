#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sszgen/common/critical.hpp>
#include <sszgen/config.hpp>
#include <sszgen/driver.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {

namespace po = boost::program_options;

void check_working_directory() {
  auto error = std::error_code{};
  auto current = std::filesystem::current_path(error);
  if (error) {
    spdlog::error("Failed reading the working directory: {}", error.message());
    sszgen::common::critical("Failed reading the working directory");
  }
  auto name = current.filename().string();
  if (name.find(sszgen::kWorkingDirectoryMarker) == std::string::npos) {
    sszgen::common::critical("please call this utility from the `{}` package",
                             sszgen::kWorkingDirectoryMarker);
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  ssz_test_gen <basic_vector|bitlist|bitvector|boolean|"
               "containers|uints> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  // stdout carries the generated source in dry-run mode
  auto logger = spdlog::stderr_color_mt("sszgen");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto category = std::string{};
  auto corpus_dir = std::string{};
  auto target_dir = std::string{};
  auto project_root = std::string{};

  auto options = po::options_description{"ssz_test_gen options"};
  options.add_options()("help,h", "show help")(
      "category", po::value<std::string>(&category),
      "fixture category to generate")(
      "corpus-dir",
      po::value<std::string>(&corpus_dir)
          ->default_value(std::string{sszgen::kDefaultCorpusRoot}),
      "root of the ssz_generic fixture tree")(
      "target-dir",
      po::value<std::string>(&target_dir)
          ->default_value(std::string{sszgen::kDefaultTargetDir}),
      "directory receiving the test source and data/")(
      "project-root",
      po::value<std::string>(&project_root)
          ->default_value(std::string{sszgen::kDefaultProjectRoot}),
      "directory generated payload paths are relative to")(
      "dry-run", "print the source and planned copies without writing")(
      "verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("category", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& error) {
    sszgen::common::critical("invalid arguments: {}", error.what());
  }

  if (vm.contains("help")) {
    print_help(options);
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  check_working_directory();

  if (category.empty()) {
    sszgen::common::critical(
        "please supply a SSZ type from the spec tests to proceed");
  }
  auto parsed = sszgen::fixture::try_parse_category(category);
  if (!parsed.has_value()) {
    sszgen::common::critical("unsupported type: {}", category);
  }

  auto config = sszgen::generator_config_t{
      .category = *parsed,
      .corpus_root = corpus_dir,
      .target_dir = target_dir,
      .project_root = project_root,
      .dry_run = vm.contains("dry-run")};
  sszgen::generate(config);

  spdlog::shutdown();
  return 0;
}
