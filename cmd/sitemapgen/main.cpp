#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/sitemap_generator.hpp"
#include "internal/input/page_loader.hpp"
#include "internal/model/format.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sink/disk_file_sink.hpp"
#include "internal/util/errors.hpp"

using sitemap::observability::IntField;
using sitemap::observability::StringField;

namespace {

constexpr int kExitUsage        = 1;
constexpr int kExitInvalidInput = 2;
constexpr int kExitEnvironment  = 3;
constexpr int kExitFailure      = 4;

void Usage() {
  std::cerr << "Usage:\n"
            << "  sitemapgen --config <config.yaml>\n"
            << "  sitemapgen <pages.yaml> <xml|json|csv> <output_path>\n";
}

} // namespace

int main(int argc, char** argv) {
  sitemap::runtime::config::RuntimeConfig config;
  bool                                    from_config_file = false;

  if (argc == 3 && std::string(argv[1]) == "--config") {
    from_config_file = true;
  } else if (argc == 4) {
    config.set_pages_path(argv[1]);
    config.mutable_output()->set_format(argv[2]);
    config.mutable_output()->set_path(argv[3]);
  } else {
    Usage();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  if (from_config_file) {
    try {
      config = sitemap::config::ConfigLoader::LoadFromYaml(argv[2]);
    } catch (const std::exception& e) {
      std::cerr << e.what() << std::endl;
      return kExitEnvironment;
    }
  }

  sitemap::observability::InitializeLogging(config);

  if (config.pages_path().empty() || config.output().path().empty()) {
    SITEMAP_LOG_ERROR("Configuration requires pages_path and output.path");
    sitemap::observability::ShutdownLogging();
    return kExitUsage;
  }

  int exit_code = 0;
  try {
    const auto pages = sitemap::input::PageLoader::LoadFromFile(config.pages_path());

    sitemap::core::SitemapGenerator generator(std::make_shared<sitemap::sink::DiskFileSink>(),
                                              sitemap::config::ToEncoderOptions(config.output()));
    generator.Generate(pages, config.output().format(), config.output().path());

    SITEMAP_LOG_INFO("Sitemap written", {StringField("format", config.output().format()), StringField("path", config.output().path()),
                                         IntField("records", static_cast<std::int64_t>(pages.size()))});
  } catch (const sitemap::util::InvalidInput& e) {
    SITEMAP_LOG_ERROR("Invalid input", {StringField("error", e.what()), StringField("rule", sitemap::validation::ToString(e.Rule()))});
    exit_code = kExitInvalidInput;
  } catch (const sitemap::util::SinkError& e) {
    SITEMAP_LOG_ERROR("Unable to write sitemap", {StringField("error", e.what()), StringField("path", config.output().path())});
    exit_code = kExitEnvironment;
  } catch (const std::exception& e) {
    SITEMAP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    exit_code = kExitFailure;
  }

  sitemap::observability::ShutdownLogging();
  return exit_code;
}
