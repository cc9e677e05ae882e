#include "sitemap_generator.hpp"

#include <stdexcept>
#include <utility>

#include "internal/encoding/encoder_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/record_validator.hpp"

namespace sitemap::core {

namespace {

void ThrowIfInvalid(const validation::ValidationResult& result) {
  if (result) {
    return;
  }
  throw util::InvalidInput(result.message, result.rule, result.record_index);
}

void ThrowIfSinkError(const sink::SinkResult& result) {
  if (result) {
    return;
  }

  switch (result.code) {
    case sink::SinkErrorCode::DirectoryCreationFailed:
      throw util::DirectoryCreationError(result.message);
    case sink::SinkErrorCode::DirectoryNotWritable:
      throw util::DirectoryNotWritable(result.message);
    case sink::SinkErrorCode::FileNotWritable:
      throw util::FileNotWritable(result.message);
    case sink::SinkErrorCode::WriteFailed:
    default:
      throw util::WriteError(result.message);
  }
}

} // namespace

SitemapGenerator::SitemapGenerator(sink::FileSinkPtr sink, encoding::EncoderOptions options)
    : sink_(std::move(sink)), options_(options) {
  if (!sink_) {
    throw std::invalid_argument("sitemap generator requires a file sink");
  }
}

std::string SitemapGenerator::Encode(const model::PageCollection& pages, model::Format format) const {
  return encoding::EncoderFactory::Build(format, options_)->Encode(pages);
}

void SitemapGenerator::Persist(const std::filesystem::path& destination, const std::string& content) const {
  ThrowIfSinkError(sink_->Write(destination, content));
}

std::string SitemapGenerator::Render(const model::PageCollection& pages, model::Format format) const {
  ThrowIfInvalid(validation::RecordValidator::Validate(pages));
  return Encode(pages, format);
}

void SitemapGenerator::Generate(const model::PageCollection& pages, model::Format format, const std::filesystem::path& destination) const {
  Persist(destination, Render(pages, format));
}

void SitemapGenerator::Generate(const model::PageCollection& pages, std::string_view format, const std::filesystem::path& destination) const {
  // Records are checked before the format literal.
  ThrowIfInvalid(validation::RecordValidator::Validate(pages));

  const auto parsed = model::ParseFormat(format);
  if (!parsed.has_value()) {
    throw util::UnsupportedFormat("unsupported sitemap format '" + std::string(format) + "', must be one of: xml, json, csv");
  }
  Persist(destination, Encode(pages, *parsed));
}

} // namespace sitemap::core
