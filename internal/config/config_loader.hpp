#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/encoding/encoder.hpp"

namespace sitemap::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static sitemap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sitemap::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

encoding::EncoderOptions ToEncoderOptions(const sitemap::runtime::config::OutputConfig& output);

} // namespace sitemap::config
