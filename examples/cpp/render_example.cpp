#include <iostream>
#include <memory>
#include <string>

#include "internal/core/sitemap_generator.hpp"
#include "internal/sink/disk_file_sink.hpp"

int main(int argc, char** argv) {
  // Output directory for the three generated files.
  const std::string out_dir = argc > 1 ? argv[1] : "/tmp/sitemap-example";

  sitemap::model::PageRecord home{{"loc", "https://example.com/"}, {"lastmod", "2024-06-27"}, {"priority", "1.0"}, {"changefreq", "daily"}};

  sitemap::model::PageRecord gallery{{"loc", "https://example.com/gallery"}, {"changefreq", "weekly"}};
  gallery.Set("image", "https://example.com/img/cover.png");

  const sitemap::model::PageCollection pages{home, gallery};

  sitemap::core::SitemapGenerator generator(std::make_shared<sitemap::sink::DiskFileSink>());

  // Print the XML rendition, then persist all three formats.
  std::cout << generator.Render(pages, sitemap::model::Format::kXml) << "\n";

  for (const auto format : {sitemap::model::Format::kXml, sitemap::model::Format::kJson, sitemap::model::Format::kCsv}) {
    const auto path = out_dir + "/sitemap." + std::string(sitemap::model::ToString(format));
    generator.Generate(pages, format, path);
    std::cout << "wrote " << path << "\n";
  }

  return 0;
}
