#pragma once

#include <string_view>

#include "internal/encoding/encoder.hpp"

namespace sitemap::encoding {

inline constexpr std::string_view kXsiNamespace     = "http://www.w3.org/2001/XMLSchema-instance";
inline constexpr std::string_view kSitemapNamespace = "http://www.sitemaps.org/schemas/sitemap/0.9";
inline constexpr std::string_view kSchemaLocation =
    "http://www.sitemaps.org/schemas/sitemap/0.9 http://www.sitemaps.org/schemas/sitemap/0.9/sitemap.xsd";

/*
  <urlset> document built with the libxml2 text writer.

  Every <url> carries loc, lastmod, priority and changefreq (empty element
  when absent), then one element per extension field. Extension keys must be
  valid XML names and every value must be UTF-8 made of XML characters;
  anything else is rejected as invalid input.
*/
class XmlEncoder final : public Encoder {
 public:
  explicit XmlEncoder(bool indent = false);

  std::string Encode(const model::PageCollection& pages) const override;

 private:
  bool indent_;
};

} // namespace sitemap::encoding
