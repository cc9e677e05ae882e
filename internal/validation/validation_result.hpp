#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace sitemap::validation {

/*
  Which record rule failed.

  Checks run per record in this order: loc presence, loc, lastmod,
  priority, changefreq.
*/
enum class ValidationRule {
  OK = 0,

  MissingLoc,
  InvalidLoc,
  InvalidLastmod,
  InvalidPriority,
  InvalidChangeFreq,

  // Raised by encoders, not by RecordValidator.
  InvalidExtensionKey,
  InvalidText,

  // Raised outside record validation.
  InvalidDocument,
  UnsupportedFormat
};

constexpr std::string_view ToString(ValidationRule rule) {
  switch (rule) {
    case ValidationRule::MissingLoc:
      return "missing_loc";
    case ValidationRule::InvalidLoc:
      return "invalid_loc";
    case ValidationRule::InvalidLastmod:
      return "invalid_lastmod";
    case ValidationRule::InvalidPriority:
      return "invalid_priority";
    case ValidationRule::InvalidChangeFreq:
      return "invalid_changefreq";
    case ValidationRule::InvalidExtensionKey:
      return "invalid_extension_key";
    case ValidationRule::InvalidText:
      return "invalid_text";
    case ValidationRule::InvalidDocument:
      return "invalid_document";
    case ValidationRule::UnsupportedFormat:
      return "unsupported_format";
    case ValidationRule::OK:
    default:
      return "ok";
  }
}

struct ValidationResult {
  ValidationRule rule         = ValidationRule::OK;
  std::size_t    record_index = 0;
  std::string    message;

  static ValidationResult Ok() {
    return {};
  }

  static ValidationResult Err(ValidationRule r, std::size_t index, std::string msg = {}) {
    return {r, index, std::move(msg)};
  }

  explicit operator bool() const {
    return rule == ValidationRule::OK;
  }
};

} // namespace sitemap::validation
