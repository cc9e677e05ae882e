#include "record_validator.hpp"

#include <string>

#include "internal/validation/field_validators.hpp"

namespace sitemap::validation {

ValidationResult RecordValidator::Validate(const model::PageCollection& pages) {
  for (std::size_t i = 0; i < pages.size(); ++i) {
    auto result = ValidateRecord(pages[i], i);
    if (!result) {
      return result;
    }
  }
  return ValidationResult::Ok();
}

ValidationResult RecordValidator::ValidateRecord(const model::PageRecord& page, std::size_t index) {
  const auto where = " (record " + std::to_string(index) + ")";

  if (!page.loc || page.loc->empty()) {
    return ValidationResult::Err(ValidationRule::MissingLoc, index, "loc is required" + where);
  }
  if (!IsValidUri(*page.loc)) {
    return ValidationResult::Err(ValidationRule::InvalidLoc, index, "loc must be an absolute URI conforming to RFC 2396" + where);
  }

  if (page.lastmod && !IsValidDate(*page.lastmod)) {
    return ValidationResult::Err(ValidationRule::InvalidLastmod, index, "lastmod must be a valid date" + where);
  }

  if (page.priority && !IsValidPriority(*page.priority)) {
    return ValidationResult::Err(ValidationRule::InvalidPriority, index, "priority must be a decimal between 0.0 and 1.0" + where);
  }

  if (page.changefreq && !IsValidChangeFreq(*page.changefreq)) {
    return ValidationResult::Err(ValidationRule::InvalidChangeFreq, index,
                                 "changefreq must be one of: always, hourly, daily, weekly, monthly, yearly, never" + where);
  }

  return ValidationResult::Ok();
}

} // namespace sitemap::validation
