#pragma once

#include <memory>
#include <string>

#include "internal/model/page.hpp"

namespace sitemap::encoding {

struct EncoderOptions {
  // XML: newline + indentation between elements. Off by default.
  bool xml_indent = false;

  // JSON: spaces per nesting level.
  int json_indent_width = 4;
};

/*
  Sitemap encoder abstraction.

  Input must already have passed RecordValidator. Encoding happens entirely
  in memory and is deterministic: equal collections give equal bytes.

  Implementations:
    XML  → sitemaps.org 0.9 urlset document
    JSON → pretty-printed array of objects
    CSV  → ';'-separated table over the union of record keys
*/
class Encoder {
 public:
  virtual ~Encoder() = default;

  virtual std::string Encode(const model::PageCollection& pages) const = 0;
};

using EncoderPtr = std::unique_ptr<Encoder>;

} // namespace sitemap::encoding
