#include "internal/core/sitemap_generator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using sitemap::core::SitemapGenerator;
using sitemap::model::Format;
using sitemap::model::PageCollection;
using sitemap::model::PageRecord;
using sitemap::sink::FileSink;
using sitemap::sink::SinkErrorCode;
using sitemap::sink::SinkResult;
using sitemap::validation::ValidationRule;

class RecordingSink final : public FileSink {
 public:
  SinkResult Write(const std::filesystem::path& path, std::string_view content) override {
    writes.push_back({path, std::string(content)});
    return SinkResult::Ok();
  }

  struct Entry {
    std::filesystem::path path;
    std::string           content;
  };
  std::vector<Entry> writes;
};

class FailingSink final : public FileSink {
 public:
  explicit FailingSink(SinkErrorCode code) : code_(code) {
  }

  SinkResult Write(const std::filesystem::path&, std::string_view) override {
    return SinkResult::Err(code_, "refused");
  }

 private:
  SinkErrorCode code_;
};

PageCollection ValidPages() {
  return {PageRecord{{"loc", "https://site.com/"}, {"lastmod", "2024-06-27"}, {"priority", "1.0"}, {"changefreq", "hourly"}},
          PageRecord{{"loc", "https://site.com/about"}, {"image", "about.png"}}};
}

void TestGenerateHandsEncodedPayloadToSink() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  generator.Generate(ValidPages(), Format::kCsv, "out/sitemap.csv");

  assert(sink->writes.size() == 1);
  assert(sink->writes[0].path == std::filesystem::path("out/sitemap.csv"));
  assert(sink->writes[0].content ==
         "loc;lastmod;priority;changefreq;image\n"
         "https://site.com/;2024-06-27;1.0;hourly;\n"
         "https://site.com/about;;;;about.png\n");
}

void TestFormatLiteralsDispatchToEncoders() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  generator.Generate(ValidPages(), "xml", "sitemap.xml");
  generator.Generate(ValidPages(), "json", "sitemap.json");
  generator.Generate(ValidPages(), "csv", "sitemap.csv");

  assert(sink->writes.size() == 3);
  assert(sink->writes[0].content.rfind("<?xml", 0) == 0);
  assert(sink->writes[1].content.rfind("[\n", 0) == 0);
  assert(sink->writes[2].content.rfind("loc;", 0) == 0);
}

void TestInvalidLocNeverReachesSink() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  auto pages = ValidPages();
  pages.push_back(PageRecord{{"loc", "not a uri"}});

  for (const auto format : {Format::kXml, Format::kJson, Format::kCsv}) {
    bool threw = false;
    try {
      generator.Generate(pages, format, "sitemap.out");
    } catch (const sitemap::util::InvalidInput& e) {
      threw = true;
      assert(e.Rule() == ValidationRule::InvalidLoc);
      assert(e.RecordIndex() == 2);
    }
    assert(threw);
  }
  assert(sink->writes.empty());
}

void TestMissingLocNeverReachesSink() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  bool threw = false;
  try {
    generator.Generate(PageCollection{PageRecord{{"lastmod", "2024-06-27"}}}, "json", "sitemap.json");
  } catch (const sitemap::util::InvalidInput& e) {
    threw = true;
    assert(e.Rule() == ValidationRule::MissingLoc);
  }
  assert(threw);
  assert(sink->writes.empty());
}

void TestUnsupportedFormatIsRejected() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  for (const auto format : {"yaml", "XML", ""}) {
    bool threw = false;
    try {
      generator.Generate(ValidPages(), format, "sitemap.out");
    } catch (const sitemap::util::UnsupportedFormat& e) {
      threw = true;
      assert(e.Rule() == ValidationRule::UnsupportedFormat);
    }
    assert(threw && "Unknown format literals must be rejected.");
  }
  assert(sink->writes.empty());
}

void TestValidationRunsBeforeFormatCheck() {
  auto             sink = std::make_shared<RecordingSink>();
  SitemapGenerator generator(sink);

  bool threw = false;
  try {
    generator.Generate(PageCollection{PageRecord{{"loc", "https://site.com/"}, {"priority", "7"}}}, "yaml", "sitemap.out");
  } catch (const sitemap::util::UnsupportedFormat&) {
    assert(false && "record validation must come first");
  } catch (const sitemap::util::InvalidInput& e) {
    threw = true;
    assert(e.Rule() == ValidationRule::InvalidPriority);
  }
  assert(threw);
}

template <typename Expected>
void ExpectSinkError(SinkErrorCode code) {
  SitemapGenerator generator(std::make_shared<FailingSink>(code));

  bool threw = false;
  try {
    generator.Generate(ValidPages(), Format::kXml, "sitemap.xml");
  } catch (const Expected& e) {
    threw = true;
    assert(std::string(e.what()) == "refused");
  }
  assert(threw);
}

void TestSinkErrorsKeepTheirKind() {
  ExpectSinkError<sitemap::util::DirectoryCreationError>(SinkErrorCode::DirectoryCreationFailed);
  ExpectSinkError<sitemap::util::DirectoryNotWritable>(SinkErrorCode::DirectoryNotWritable);
  ExpectSinkError<sitemap::util::FileNotWritable>(SinkErrorCode::FileNotWritable);
  ExpectSinkError<sitemap::util::WriteError>(SinkErrorCode::WriteFailed);
}

void TestRenderIsDeterministic() {
  SitemapGenerator generator(std::make_shared<RecordingSink>());

  for (const auto format : {Format::kXml, Format::kJson, Format::kCsv}) {
    assert(generator.Render(ValidPages(), format) == generator.Render(ValidPages(), format));
  }
}

void TestEncoderOptionsAreApplied() {
  sitemap::encoding::EncoderOptions options;
  options.json_indent_width = 2;
  SitemapGenerator generator(std::make_shared<RecordingSink>(), options);

  const auto json = generator.Render(ValidPages(), Format::kJson);
  assert(json.rfind("[\n  {\n    \"loc\"", 0) == 0);
}

} // namespace

int main() {
  TestGenerateHandsEncodedPayloadToSink();
  TestFormatLiteralsDispatchToEncoders();
  TestInvalidLocNeverReachesSink();
  TestMissingLocNeverReachesSink();
  TestUnsupportedFormatIsRejected();
  TestValidationRunsBeforeFormatCheck();
  TestSinkErrorsKeepTheirKind();
  TestRenderIsDeterministic();
  TestEncoderOptionsAreApplied();

  std::cout << "sitemap_generator_unit_sitemap_generator: pass\n";
  return 0;
}
