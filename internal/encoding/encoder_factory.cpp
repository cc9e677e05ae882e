#include "encoder_factory.hpp"

#include <stdexcept>

#include "csv_encoder.hpp"
#include "json_encoder.hpp"
#include "xml_encoder.hpp"

namespace sitemap::encoding {

EncoderPtr EncoderFactory::Build(model::Format format, const EncoderOptions& options) {
  switch (format) {
    case model::Format::kXml:
      return std::make_unique<XmlEncoder>(options.xml_indent);
    case model::Format::kJson:
      return std::make_unique<JsonEncoder>(options.json_indent_width);
    case model::Format::kCsv:
      return std::make_unique<CsvEncoder>();
  }
  throw std::logic_error("unhandled sitemap format");
}

} // namespace sitemap::encoding
