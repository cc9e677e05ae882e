#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sitemap::model {

inline constexpr std::string_view kLocKey        = "loc";
inline constexpr std::string_view kLastmodKey    = "lastmod";
inline constexpr std::string_view kPriorityKey   = "priority";
inline constexpr std::string_view kChangeFreqKey = "changefreq";

using Field           = std::pair<std::string, std::string>;
using ExtensionFields = std::vector<Field>;

/*
  One URL entry.

  The four recognized sitemap fields live in fixed members; every other key
  goes to `extensions`, kept in insertion order.

  Key order of a record (used for CSV columns):
    present recognized fields in loc, lastmod, priority, changefreq order,
    then extension keys in insertion order.
*/
struct PageRecord {
  std::optional<std::string> loc;
  std::optional<std::string> lastmod;
  std::optional<std::string> priority;
  std::optional<std::string> changefreq;

  ExtensionFields extensions;

  PageRecord() = default;
  PageRecord(std::initializer_list<Field> fields);

  // Routes recognized keys to their member; re-setting an extension keeps its position.
  void Set(std::string_view key, std::string value);

  std::optional<std::string> Get(std::string_view key) const;

  std::vector<std::string> Keys() const;
};

using PageCollection = std::vector<PageRecord>;

} // namespace sitemap::model
