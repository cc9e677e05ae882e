#pragma once

#include <string>

#include "internal/model/page.hpp"

namespace sitemap::input {

/*
  Reads a page collection from YAML (JSON is accepted as YAML).

  Document shape, either:

      - loc: https://example.com/
        lastmod: 2024-06-27
      - loc: https://example.com/about

  or the same sequence under a top-level `pages` key.

  Field order inside each entry is preserved. Scalars are taken as raw text,
  null values count as absent. Anything else is util::InvalidInput.
*/
class PageLoader {
 public:
  static model::PageCollection LoadFromFile(const std::string& path);

  static model::PageCollection LoadFromString(const std::string& document);
};

} // namespace sitemap::input
