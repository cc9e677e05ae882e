#include "json_encoder.hpp"

#include <nlohmann/json.hpp>

#include <string>

#include "internal/util/errors.hpp"

namespace sitemap::encoding {

namespace {

using OrderedJson = nlohmann::ordered_json;

OrderedJson ToJson(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

} // namespace

JsonEncoder::JsonEncoder(int indent_width) : indent_width_(indent_width > 0 ? indent_width : 4) {
}

std::string JsonEncoder::Encode(const model::PageCollection& pages) const {
  auto array = OrderedJson::array();

  for (const auto& page : pages) {
    OrderedJson item = OrderedJson::object();
    item[std::string(model::kLocKey)]        = ToJson(page.loc);
    item[std::string(model::kLastmodKey)]    = ToJson(page.lastmod);
    item[std::string(model::kPriorityKey)]   = ToJson(page.priority);
    item[std::string(model::kChangeFreqKey)] = ToJson(page.changefreq);

    for (const auto& [key, value] : page.extensions) {
      item[key] = value;
    }

    array.push_back(std::move(item));
  }

  try {
    return array.dump(indent_width_, ' ', false, OrderedJson::error_handler_t::strict);
  } catch (const OrderedJson::type_error& e) {
    throw util::InvalidInput(std::string("page values must be valid UTF-8: ") + e.what(), validation::ValidationRule::InvalidText);
  }
}

} // namespace sitemap::encoding
