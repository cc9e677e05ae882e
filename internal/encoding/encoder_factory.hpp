#pragma once

#include "internal/encoding/encoder.hpp"
#include "internal/model/format.hpp"

namespace sitemap::encoding {

/*
  Builds the encoder for a format.

      auto encoder = EncoderFactory::Build(Format::kCsv);
      auto text    = encoder->Encode(pages);
*/
class EncoderFactory {
 public:
  static EncoderPtr Build(model::Format format, const EncoderOptions& options = {});
};

} // namespace sitemap::encoding
