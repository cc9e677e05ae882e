#include "internal/validation/record_validator.hpp"

#include <cassert>
#include <iostream>

namespace {

using sitemap::model::PageCollection;
using sitemap::model::PageRecord;
using sitemap::validation::RecordValidator;
using sitemap::validation::ValidationRule;

PageRecord ValidPage(const std::string& loc) {
  return PageRecord{{"loc", loc}, {"lastmod", "2024-06-27"}, {"priority", "0.8"}, {"changefreq", "weekly"}};
}

void TestValidCollectionPasses() {
  PageCollection pages{ValidPage("https://site.com/"), PageRecord{{"loc", "https://site.com/about"}}};
  pages[1].Set("image", "not validated at all");

  const auto result = RecordValidator::Validate(pages);
  assert(result);
  assert(result.rule == ValidationRule::OK);
}

void TestEmptyCollectionPasses() {
  assert(RecordValidator::Validate(PageCollection{}));
}

void TestMissingLocIsReported() {
  PageCollection pages{ValidPage("https://site.com/"), PageRecord{{"priority", "0.5"}}};

  const auto result = RecordValidator::Validate(pages);
  assert(!result);
  assert(result.rule == ValidationRule::MissingLoc);
  assert(result.record_index == 1);
  assert(!result.message.empty());
}

void TestEmptyLocCountsAsMissing() {
  PageCollection pages{PageRecord{{"loc", ""}}};
  assert(RecordValidator::Validate(pages).rule == ValidationRule::MissingLoc);
}

void TestInvalidLocIsReported() {
  PageCollection pages{PageRecord{{"loc", "not a uri"}}};

  const auto result = RecordValidator::Validate(pages);
  assert(result.rule == ValidationRule::InvalidLoc);
  assert(result.record_index == 0);
}

void TestOptionalFieldRules() {
  auto bad_lastmod = ValidPage("https://site.com/");
  bad_lastmod.Set("lastmod", "not-a-date");
  assert(RecordValidator::Validate({bad_lastmod}).rule == ValidationRule::InvalidLastmod);

  auto bad_priority = ValidPage("https://site.com/");
  bad_priority.Set("priority", "1.01");
  assert(RecordValidator::Validate({bad_priority}).rule == ValidationRule::InvalidPriority);

  auto bad_changefreq = ValidPage("https://site.com/");
  bad_changefreq.Set("changefreq", "Daily");
  assert(RecordValidator::Validate({bad_changefreq}).rule == ValidationRule::InvalidChangeFreq);
}

void TestChecksRunInFixedOrderWithinRecord() {
  PageRecord page{{"loc", "bad uri"}, {"lastmod", "bad"}, {"priority", "9"}, {"changefreq", "bad"}};
  assert(RecordValidator::Validate({page}).rule == ValidationRule::InvalidLoc);

  page.Set("loc", "https://site.com/");
  assert(RecordValidator::Validate({page}).rule == ValidationRule::InvalidLastmod);

  page.Set("lastmod", "2024-01-01");
  assert(RecordValidator::Validate({page}).rule == ValidationRule::InvalidPriority);

  page.Set("priority", "0.1");
  assert(RecordValidator::Validate({page}).rule == ValidationRule::InvalidChangeFreq);
}

void TestFirstViolationAcrossCollectionWins() {
  auto second = ValidPage("https://site.com/b");
  second.Set("priority", "2");
  auto third = ValidPage("https://site.com/c");
  third.loc.reset();

  const auto result = RecordValidator::Validate({ValidPage("https://site.com/a"), second, third});
  assert(result.rule == ValidationRule::InvalidPriority);
  assert(result.record_index == 1);
}

} // namespace

int main() {
  TestValidCollectionPasses();
  TestEmptyCollectionPasses();
  TestMissingLocIsReported();
  TestEmptyLocCountsAsMissing();
  TestInvalidLocIsReported();
  TestOptionalFieldRules();
  TestChecksRunInFixedOrderWithinRecord();
  TestFirstViolationAcrossCollectionWins();

  std::cout << "sitemap_generator_unit_record_validator: pass\n";
  return 0;
}
