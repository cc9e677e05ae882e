#include "csv_encoder.hpp"

#include <unordered_set>

namespace sitemap::encoding {

std::vector<std::string> CsvEncoder::HeaderKeys(const model::PageCollection& pages) {
  std::vector<std::string>        keys;
  std::unordered_set<std::string> seen;

  for (const auto& page : pages) {
    for (auto& key : page.Keys()) {
      if (seen.insert(key).second) {
        keys.push_back(std::move(key));
      }
    }
  }
  return keys;
}

std::string CsvEncoder::Encode(const model::PageCollection& pages) const {
  const auto keys = HeaderKeys(pages);

  std::string out;

  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) out.push_back(kCsvDelimiter);
    out += keys[i];
  }
  out.push_back('\n');

  for (const auto& page : pages) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (i > 0) out.push_back(kCsvDelimiter);
      if (auto value = page.Get(keys[i])) {
        out += *value;
      }
    }
    out.push_back('\n');
  }

  return out;
}

} // namespace sitemap::encoding
