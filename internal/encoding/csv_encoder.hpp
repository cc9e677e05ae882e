#pragma once

#include <string>
#include <vector>

#include "internal/encoding/encoder.hpp"

namespace sitemap::encoding {

inline constexpr char kCsvDelimiter = ';';

/*
  ';'-separated table.

  Columns are the union of all record keys, first-seen order. Missing keys
  give empty fields. Values are written as-is: a value containing ';' or a
  newline will shift or split its row.
*/
class CsvEncoder final : public Encoder {
 public:
  std::string Encode(const model::PageCollection& pages) const override;

  static std::vector<std::string> HeaderKeys(const model::PageCollection& pages);
};

} // namespace sitemap::encoding
