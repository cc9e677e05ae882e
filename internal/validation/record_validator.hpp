#pragma once

#include "internal/model/page.hpp"
#include "internal/validation/validation_result.hpp"

namespace sitemap::validation {

/*
  Fail-fast validation of a page collection.

  Records are checked in order; the first violation is returned and nothing
  after it is looked at.
*/
class RecordValidator {
 public:
  static ValidationResult Validate(const model::PageCollection& pages);

  static ValidationResult ValidateRecord(const model::PageRecord& page, std::size_t index);
};

} // namespace sitemap::validation
