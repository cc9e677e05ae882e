#include "page_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sitemap::input {

namespace {

std::string Where(std::size_t index) {
  return " (record " + std::to_string(index) + ")";
}

model::PageRecord ToPageRecord(const YAML::Node& entry, std::size_t index) {
  if (!entry.IsMap()) {
    throw util::InvalidInput("page entry must be a mapping of field names to values" + Where(index), validation::ValidationRule::InvalidDocument, index);
  }

  model::PageRecord page;
  for (const auto& field : entry) {
    const auto key = field.first.Scalar();
    const auto& value = field.second;

    if (value.IsNull()) {
      continue;
    }
    if (!value.IsScalar()) {
      throw util::InvalidInput("page field '" + key + "' must be a scalar value" + Where(index), validation::ValidationRule::InvalidDocument, index);
    }
    page.Set(key, value.Scalar());
  }
  return page;
}

model::PageCollection FromYamlNode(const YAML::Node& document) {
  if (document.IsNull()) {
    return {};
  }

  const YAML::Node pages = document.IsMap() ? document["pages"] : document;
  if (document.IsMap()) {
    if (!pages) {
      throw util::InvalidInput("page document must be a sequence or contain a 'pages' sequence", validation::ValidationRule::InvalidDocument);
    }
    if (pages.IsNull()) {
      return {};
    }
  }
  if (!pages.IsSequence()) {
    throw util::InvalidInput("pages must be a sequence of mappings", validation::ValidationRule::InvalidDocument);
  }

  model::PageCollection collection;
  collection.reserve(pages.size());
  for (std::size_t i = 0; i < pages.size(); ++i) {
    collection.push_back(ToPageRecord(pages[i], i));
  }
  return collection;
}

} // namespace

model::PageCollection PageLoader::LoadFromFile(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    throw std::runtime_error("Failed to open page document " + path + ": " + std::string(e.what()));
  } catch (const YAML::Exception& e) {
    throw util::InvalidInput("Failed to parse page document " + path + ": " + std::string(e.what()), validation::ValidationRule::InvalidDocument);
  }
  return FromYamlNode(document);
}

model::PageCollection PageLoader::LoadFromString(const std::string& document) {
  YAML::Node node;
  try {
    node = YAML::Load(document);
  } catch (const YAML::Exception& e) {
    throw util::InvalidInput("Failed to parse page document: " + std::string(e.what()), validation::ValidationRule::InvalidDocument);
  }
  return FromYamlNode(node);
}

} // namespace sitemap::input
