#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace sitemap::sink {

/*
  Portable sink result codes.

  Sink implementations translate filesystem / IO library failures into
  these. The generator never sees backend error types.
*/
enum class SinkErrorCode {
  OK = 0,

  DirectoryCreationFailed,
  DirectoryNotWritable,
  FileNotWritable,
  WriteFailed
};

struct SinkResult {
  SinkErrorCode code = SinkErrorCode::OK;
  std::string   message;

  static SinkResult Ok() {
    return {};
  }

  static SinkResult Err(SinkErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == SinkErrorCode::OK;
  }
};

/*
  Where finished sitemap text goes.

  Write() either persists all of `content` at `path` or reports why not.
*/
class FileSink {
 public:
  virtual ~FileSink() = default;

  virtual SinkResult Write(const std::filesystem::path& path, std::string_view content) = 0;
};

using FileSinkPtr = std::shared_ptr<FileSink>;

} // namespace sitemap::sink
