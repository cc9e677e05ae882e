#pragma once

#include <filesystem>

#include "internal/sink/file_sink.hpp"

namespace sitemap::sink {

/*
  Local filesystem sink using Arrow IO.

  Properties:
    - missing parent directories are created recursively
    - writability of the directory and of an existing target is checked
      before anything is written
    - the target is truncated and written in place; symlinks are followed
      and an existing file keeps its mode and owner
*/
class DiskFileSink final : public FileSink {
 public:
  SinkResult Write(const std::filesystem::path& path, std::string_view content) override;
};

} // namespace sitemap::sink
