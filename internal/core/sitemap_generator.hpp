#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "internal/encoding/encoder.hpp"
#include "internal/model/format.hpp"
#include "internal/model/page.hpp"
#include "internal/sink/file_sink.hpp"

namespace sitemap::core {

/*
  Validate → encode → persist.

  The generator holds only its sink and encoder options; every Generate()
  call is independent. Nothing reaches the sink unless validation and
  encoding both succeeded.

  Errors:
    util::InvalidInput       → a record broke a rule (rule + record index)
    util::UnsupportedFormat  → format literal is not xml, json or csv
    util::SinkError subtypes → the sink refused the write
*/
class SitemapGenerator {
 public:
  explicit SitemapGenerator(sink::FileSinkPtr sink, encoding::EncoderOptions options = {});

  void Generate(const model::PageCollection& pages, model::Format format, const std::filesystem::path& destination) const;

  void Generate(const model::PageCollection& pages, std::string_view format, const std::filesystem::path& destination) const;

  // Validation + encoding only; no sink involved.
  std::string Render(const model::PageCollection& pages, model::Format format) const;

 private:
  std::string Encode(const model::PageCollection& pages, model::Format format) const;
  void        Persist(const std::filesystem::path& destination, const std::string& content) const;

  sink::FileSinkPtr        sink_;
  encoding::EncoderOptions options_;
};

} // namespace sitemap::core
