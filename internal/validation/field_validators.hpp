#pragma once

#include <array>
#include <string_view>

namespace sitemap::validation {

/*
  Stateless predicates over raw field text.

  None of these throw; anything unparseable is simply invalid.
*/

inline constexpr std::array<std::string_view, 7> kChangeFrequencies = {"always", "hourly", "daily", "weekly", "monthly", "yearly", "never"};

// Absolute URI with scheme and authority; printable US-ASCII only.
bool IsValidUri(std::string_view text);

/*
  Calendar date or date-time.

  Accepts W3C DATETIME (YYYY, YYYY-MM, YYYY-MM-DD, YYYY-MM-DDThh:mm[:ss[.s]]
  with optional Z/±hh:mm), "YYYY-MM-DD hh:mm[:ss]", "YYYY/MM/DD",
  RFC 1123, "27 June 2024" and "June 27, 2024". The day must exist.
*/
bool IsValidDate(std::string_view text);

// Base-10 decimal in [0.0, 1.0].
bool IsValidPriority(std::string_view text);

// Case-sensitive member of kChangeFrequencies.
bool IsValidChangeFreq(std::string_view text);

} // namespace sitemap::validation
