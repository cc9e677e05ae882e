#pragma once

#include "internal/encoding/encoder.hpp"

namespace sitemap::encoding {

/*
  Pretty-printed JSON array, one object per page.

  Keys: loc, lastmod, priority, changefreq (null when absent), then
  extension keys in insertion order. Object key order is never resorted.
*/
class JsonEncoder final : public Encoder {
 public:
  explicit JsonEncoder(int indent_width = 4);

  std::string Encode(const model::PageCollection& pages) const override;

 private:
  int indent_width_;
};

} // namespace sitemap::encoding
