#include "field_validators.hpp"

#include <libxml/uri.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <locale>
#include <memory>
#include <sstream>
#include <string>

namespace sitemap::validation {

namespace {

struct UriDeleter {
  void operator()(xmlURIPtr uri) const {
    xmlFreeURI(uri);
  }
};

using UriPtr = std::unique_ptr<xmlURI, UriDeleter>;

bool IsDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Parses the whole of `text` with `format`; partial matches are failures.
bool ParsesAs(const std::string& text, const char* format, std::tm& tm) {
  tm         = std::tm{};
  tm.tm_mday = 1;

  std::istringstream in(text);
  in.imbue(std::locale::classic());
  in >> std::get_time(&tm, format);
  return !in.fail() && in.peek() == std::char_traits<char>::eof();
}

bool IsExistingDay(const std::tm& tm) {
  const std::chrono::year_month_day ymd{std::chrono::year{tm.tm_year + 1900}, std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                                        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
  return ymd.ok();
}

// Sign, then hh in 00-23 and mm in 00-59.
bool IsZoneOffset(char sign, std::string_view hours, std::string_view minutes) {
  if ((sign != '+' && sign != '-') || hours.size() != 2 || minutes.size() != 2 || !IsDigits(hours) || !IsDigits(minutes)) {
    return false;
  }
  return std::stoi(std::string(hours)) <= 23 && std::stoi(std::string(minutes)) <= 59;
}

// "Z", "+hh:mm" or "-hh:mm" at the end of a W3C time.
std::string StripZoneDesignator(std::string text) {
  if (!text.empty() && text.back() == 'Z') {
    text.pop_back();
    return text;
  }
  if (text.size() >= 6) {
    const auto zone = std::string_view(text).substr(text.size() - 6);
    if (zone[3] == ':' && IsZoneOffset(zone[0], zone.substr(1, 2), zone.substr(4, 2))) {
      text.resize(text.size() - 6);
    }
  }
  return text;
}

// "hh:mm:ss.fraction" → "hh:mm:ss"
std::string StripFraction(std::string text) {
  const auto dot = text.rfind('.');
  if (dot != std::string::npos && dot >= 3 && text[dot - 3] == ':' && IsDigits(std::string_view(text).substr(dot + 1))) {
    text.resize(dot);
  }
  return text;
}

// Trailing " GMT", " UTC" or " +hhmm" of an RFC 1123 date.
std::string StripRfc1123Zone(std::string text) {
  const auto space = text.rfind(' ');
  if (space == std::string::npos) {
    return text;
  }
  const auto zone = std::string_view(text).substr(space + 1);
  if (zone == "GMT" || zone == "UTC" || (zone.size() == 5 && IsZoneOffset(zone[0], zone.substr(1, 2), zone.substr(3, 2)))) {
    text.resize(space);
  }
  return text;
}

bool IsPlainDecimal(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) != 0 || c == '.' || c == '+' || c == '-' || c == 'e' || c == 'E';
  });
}

} // namespace

bool IsValidUri(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (unsigned char c : text) {
    if (c <= 0x20 || c >= 0x7F) {
      return false;
    }
  }

  const std::string value(text);
  UriPtr            uri(xmlParseURI(value.c_str()));
  if (!uri) {
    return false;
  }
  return uri->scheme != nullptr && uri->server != nullptr && uri->server[0] != '\0';
}

bool IsValidDate(std::string_view text) {
  if (text.empty()) {
    return false;
  }

  const std::string value(text);
  std::tm           tm{};

  static constexpr const char* kDateFormats[] = {"%Y-%m-%d", "%Y-%m", "%Y", "%Y/%m/%d", "%d %B %Y", "%B %d, %Y"};
  for (const char* format : kDateFormats) {
    if (ParsesAs(value, format, tm)) {
      return IsExistingDay(tm);
    }
  }

  const auto separator = value.find_first_of("T ");
  if (separator != std::string::npos && separator == 10) {
    const auto w3c = StripFraction(StripZoneDesignator(value));
    static constexpr const char* kDateTimeFormats[] = {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%dT%H:%M", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M"};
    for (const char* format : kDateTimeFormats) {
      if (ParsesAs(w3c, format, tm)) {
        return IsExistingDay(tm);
      }
    }
  }

  if (ParsesAs(StripRfc1123Zone(value), "%a, %d %b %Y %H:%M:%S", tm)) {
    return IsExistingDay(tm);
  }

  return false;
}

bool IsValidPriority(std::string_view text) {
  if (!IsPlainDecimal(text)) {
    return false;
  }

  const std::string value(text);
  char*             end    = nullptr;
  const double      parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size() || !std::isfinite(parsed)) {
    return false;
  }
  return parsed >= 0.0 && parsed <= 1.0;
}

bool IsValidChangeFreq(std::string_view text) {
  return std::find(kChangeFrequencies.begin(), kChangeFrequencies.end(), text) != kChangeFrequencies.end();
}

} // namespace sitemap::validation
