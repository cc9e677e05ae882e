#include "xml_encoder.hpp"

#include <libxml/chvalid.h>
#include <libxml/entities.h>
#include <libxml/tree.h>
#include <libxml/xmlmemory.h>
#include <libxml/xmlstring.h>
#include <libxml/xmlwriter.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace sitemap::encoding {

namespace {

struct BufferDeleter {
  void operator()(xmlBufferPtr buffer) const {
    xmlBufferFree(buffer);
  }
};

struct WriterDeleter {
  void operator()(xmlTextWriterPtr writer) const {
    xmlFreeTextWriter(writer);
  }
};

struct XmlCharDeleter {
  void operator()(xmlChar* text) const {
    xmlFree(text);
  }
};

const xmlChar* Chars(std::string_view text) {
  return reinterpret_cast<const xmlChar*>(text.data());
}

/*
  Helper: libxml2 writer calls return < 0 on failure.
*/
void Check(int rc, const char* what) {
  if (rc < 0) throw std::runtime_error(std::string("xml writer failed: ") + what);
}

/*
  Escapes &, <, >, " (and CR) via libxml2, then writes the result verbatim.
  Absent or empty values leave an empty element.
*/
void WriteElement(xmlTextWriterPtr writer, const std::string& name, const std::optional<std::string>& value) {
  Check(xmlTextWriterStartElement(writer, Chars(name)), "start element");

  if (value && !value->empty()) {
    std::unique_ptr<xmlChar, XmlCharDeleter> escaped(xmlEncodeSpecialChars(nullptr, Chars(*value)));
    if (!escaped) throw std::runtime_error("xml writer failed: escape text");
    Check(xmlTextWriterWriteRaw(writer, escaped.get()), "write text");
  }

  Check(xmlTextWriterEndElement(writer), "end element");
}

// UTF-8 made only of XML 1.0 Char code points.
bool IsXmlText(const std::string& text) {
  if (text.find('\0') != std::string::npos) {
    return false;
  }

  const auto* utf = reinterpret_cast<const unsigned char*>(text.c_str());
  if (xmlCheckUTF8(utf) == 0) {
    return false;
  }

  int remaining = static_cast<int>(text.size());
  while (remaining > 0) {
    int       len       = remaining;
    const int codepoint = xmlGetUTF8Char(utf, &len);
    if (codepoint < 0 || !xmlIsCharQ(codepoint)) {
      return false;
    }
    utf += len;
    remaining -= len;
  }
  return true;
}

void RequireXmlText(const std::optional<std::string>& value, std::string_view name, std::size_t index) {
  if (value && !IsXmlText(*value)) {
    throw util::InvalidInput("value of '" + std::string(name) + "' is not valid XML text (record " + std::to_string(index) + ")",
                             validation::ValidationRule::InvalidText, index);
  }
}

/*
  Rejects extension keys that are not XML names and values that are not
  UTF-8 XML characters, before any output is produced.
*/
void RequireWritableRecords(const model::PageCollection& pages) {
  for (std::size_t i = 0; i < pages.size(); ++i) {
    const auto& page = pages[i];

    RequireXmlText(page.loc, model::kLocKey, i);
    RequireXmlText(page.lastmod, model::kLastmodKey, i);
    RequireXmlText(page.priority, model::kPriorityKey, i);
    RequireXmlText(page.changefreq, model::kChangeFreqKey, i);

    for (const auto& [key, value] : page.extensions) {
      if (key.empty() || xmlValidateName(Chars(key), 0) != 0) {
        throw util::InvalidInput("extension key '" + key + "' is not a valid XML element name (record " + std::to_string(i) + ")",
                                 validation::ValidationRule::InvalidExtensionKey, i);
      }
      RequireXmlText(value, key, i);
    }
  }
}

} // namespace

XmlEncoder::XmlEncoder(bool indent) : indent_(indent) {
}

std::string XmlEncoder::Encode(const model::PageCollection& pages) const {
  RequireWritableRecords(pages);

  std::unique_ptr<xmlBuffer, BufferDeleter> buffer(xmlBufferCreate());
  if (!buffer) throw std::runtime_error("xml writer failed: allocate buffer");

  std::unique_ptr<xmlTextWriter, WriterDeleter> writer(xmlNewTextWriterMemory(buffer.get(), 0));
  if (!writer) throw std::runtime_error("xml writer failed: create writer");

  if (indent_) {
    Check(xmlTextWriterSetIndent(writer.get(), 1), "set indent");
    Check(xmlTextWriterSetIndentString(writer.get(), Chars("  ")), "set indent string");
  }

  Check(xmlTextWriterStartDocument(writer.get(), "1.0", "UTF-8", nullptr), "start document");

  Check(xmlTextWriterStartElement(writer.get(), Chars("urlset")), "start urlset");
  Check(xmlTextWriterWriteAttribute(writer.get(), Chars("xmlns:xsi"), Chars(kXsiNamespace)), "xmlns:xsi");
  Check(xmlTextWriterWriteAttribute(writer.get(), Chars("xmlns"), Chars(kSitemapNamespace)), "xmlns");
  Check(xmlTextWriterWriteAttribute(writer.get(), Chars("xsi:schemaLocation"), Chars(kSchemaLocation)), "xsi:schemaLocation");

  for (const auto& page : pages) {
    Check(xmlTextWriterStartElement(writer.get(), Chars("url")), "start url");

    WriteElement(writer.get(), std::string(model::kLocKey), page.loc);
    WriteElement(writer.get(), std::string(model::kLastmodKey), page.lastmod);
    WriteElement(writer.get(), std::string(model::kPriorityKey), page.priority);
    WriteElement(writer.get(), std::string(model::kChangeFreqKey), page.changefreq);

    for (const auto& [key, value] : page.extensions) {
      WriteElement(writer.get(), key, value);
    }

    Check(xmlTextWriterEndElement(writer.get()), "end url");
  }

  Check(xmlTextWriterEndDocument(writer.get()), "end document");
  Check(xmlTextWriterFlush(writer.get()), "flush");

  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())), static_cast<std::size_t>(xmlBufferLength(buffer.get())));
}

} // namespace sitemap::encoding
