#include "page.hpp"

#include <algorithm>

namespace sitemap::model {

namespace {

std::optional<std::string>* RecognizedSlot(PageRecord& record, std::string_view key) {
  if (key == kLocKey) return &record.loc;
  if (key == kLastmodKey) return &record.lastmod;
  if (key == kPriorityKey) return &record.priority;
  if (key == kChangeFreqKey) return &record.changefreq;
  return nullptr;
}

} // namespace

PageRecord::PageRecord(std::initializer_list<Field> fields) {
  for (const auto& [key, value] : fields) {
    Set(key, value);
  }
}

void PageRecord::Set(std::string_view key, std::string value) {
  if (auto* slot = RecognizedSlot(*this, key)) {
    *slot = std::move(value);
    return;
  }

  auto it = std::find_if(extensions.begin(), extensions.end(), [&](const Field& field) { return field.first == key; });
  if (it != extensions.end()) {
    it->second = std::move(value);
    return;
  }
  extensions.emplace_back(std::string(key), std::move(value));
}

std::optional<std::string> PageRecord::Get(std::string_view key) const {
  if (key == kLocKey) return loc;
  if (key == kLastmodKey) return lastmod;
  if (key == kPriorityKey) return priority;
  if (key == kChangeFreqKey) return changefreq;

  for (const auto& [name, value] : extensions) {
    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

std::vector<std::string> PageRecord::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(4 + extensions.size());

  if (loc) keys.emplace_back(kLocKey);
  if (lastmod) keys.emplace_back(kLastmodKey);
  if (priority) keys.emplace_back(kPriorityKey);
  if (changefreq) keys.emplace_back(kChangeFreqKey);

  for (const auto& field : extensions) {
    keys.push_back(field.first);
  }
  return keys;
}

} // namespace sitemap::model
