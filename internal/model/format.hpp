#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sitemap::model {

enum class Format : std::uint8_t {
  kXml  = 1,
  kJson = 2,
  kCsv  = 3,
};

constexpr std::string_view ToString(Format format) {
  switch (format) {
    case Format::kXml:
      return "xml";
    case Format::kJson:
      return "json";
    case Format::kCsv:
      return "csv";
  }
  return "unknown";
}

// Exact, case-sensitive match on the three format literals.
constexpr std::optional<Format> ParseFormat(std::string_view value) {
  if (value == "xml") {
    return Format::kXml;
  }
  if (value == "json") {
    return Format::kJson;
  }
  if (value == "csv") {
    return Format::kCsv;
  }
  return std::nullopt;
}

} // namespace sitemap::model
