#include "internal/validation/field_validators.hpp"

#include <cassert>
#include <iostream>

namespace {

using sitemap::validation::IsValidChangeFreq;
using sitemap::validation::IsValidDate;
using sitemap::validation::IsValidPriority;
using sitemap::validation::IsValidUri;

void TestUriAcceptsAbsoluteUrls() {
  assert(IsValidUri("https://site.com/"));
  assert(IsValidUri("http://example.com/path/page.html?x=1&y=2#top"));
  assert(IsValidUri("https://user@example.com:8443/a%20b"));
  assert(IsValidUri("ftp://files.example.org/pub"));
}

void TestUriRejectsRelativeAndMalformed() {
  assert(!IsValidUri(""));
  assert(!IsValidUri("not a uri"));
  assert(!IsValidUri("/relative/path"));
  assert(!IsValidUri("//example.com/no-scheme"));
  assert(!IsValidUri("example.com"));
  assert(!IsValidUri("http://"));
  assert(!IsValidUri("mailto:someone@example.com"));
  assert(!IsValidUri("https://exa mple.com/"));
  assert(!IsValidUri("https://example.com/\n"));
  assert(!IsValidUri("https://example.com/caf\xC3\xA9"));
}

void TestDateAcceptsW3cDatetime() {
  assert(IsValidDate("2024"));
  assert(IsValidDate("2024-06"));
  assert(IsValidDate("2024-06-27"));
  assert(IsValidDate("2024-06-27T10:15Z"));
  assert(IsValidDate("2024-06-27T10:15:30+02:00"));
  assert(IsValidDate("2024-06-27T10:15:30.45-05:00"));
  assert(IsValidDate("2024-06-27T10:15:30"));
}

void TestDateAcceptsCommonRealWorldShapes() {
  assert(IsValidDate("2024-06-27 10:15:30"));
  assert(IsValidDate("2024-06-27 10:15"));
  assert(IsValidDate("2024/06/27"));
  assert(IsValidDate("Thu, 27 Jun 2024 10:15:30 GMT"));
  assert(IsValidDate("27 June 2024"));
  assert(IsValidDate("June 27, 2024"));
}

void TestDateRejectsImpossibleAndGarbage() {
  assert(!IsValidDate(""));
  assert(!IsValidDate("yesterday-ish"));
  assert(!IsValidDate("2024-13-01"));
  assert(!IsValidDate("2024-02-30"));
  assert(!IsValidDate("2023-02-29"));
  assert(IsValidDate("2024-02-29"));
  assert(!IsValidDate("2024-06-27T25:00"));
  assert(!IsValidDate("2024-06-27 trailing"));
}

void TestDateZoneOffsetMustBeInRange() {
  assert(IsValidDate("2024-06-27T10:15:30+23:59"));
  assert(IsValidDate("2024-06-27T10:15:30-00:00"));
  assert(!IsValidDate("2024-06-27T10:15:30+25:99"));
  assert(!IsValidDate("2024-06-27T10:15:30+24:00"));
  assert(!IsValidDate("2024-06-27T10:15-05:60"));

  assert(IsValidDate("Thu, 27 Jun 2024 10:15:30 +0200"));
  assert(!IsValidDate("Thu, 27 Jun 2024 10:15:30 +2599"));
}

void TestPriorityBoundaries() {
  assert(IsValidPriority("0.0"));
  assert(IsValidPriority("1.0"));
  assert(IsValidPriority("0.5"));
  assert(IsValidPriority("1"));
  assert(IsValidPriority("0"));
  assert(IsValidPriority(".8"));
  assert(IsValidPriority("5e-1"));

  assert(!IsValidPriority("-0.01"));
  assert(!IsValidPriority("1.01"));
  assert(!IsValidPriority("high"));
  assert(!IsValidPriority(""));
  assert(!IsValidPriority("0x1"));
  assert(!IsValidPriority("nan"));
  assert(!IsValidPriority(" 0.5"));
  assert(!IsValidPriority("0.5."));
}

void TestChangeFreqIsExactAndCaseSensitive() {
  for (const auto value : {"always", "hourly", "daily", "weekly", "monthly", "yearly", "never"}) {
    assert(IsValidChangeFreq(value));
  }
  assert(!IsValidChangeFreq("Daily"));
  assert(!IsValidChangeFreq("DAILY"));
  assert(!IsValidChangeFreq("fortnightly"));
  assert(!IsValidChangeFreq(" daily"));
  assert(!IsValidChangeFreq(""));
}

} // namespace

int main() {
  TestUriAcceptsAbsoluteUrls();
  TestUriRejectsRelativeAndMalformed();
  TestDateAcceptsW3cDatetime();
  TestDateAcceptsCommonRealWorldShapes();
  TestDateRejectsImpossibleAndGarbage();
  TestDateZoneOffsetMustBeInRange();
  TestPriorityBoundaries();
  TestChangeFreqIsExactAndCaseSensitive();

  std::cout << "sitemap_generator_unit_field_validators: pass\n";
  return 0;
}
