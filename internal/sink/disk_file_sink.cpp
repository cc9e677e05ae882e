#include "disk_file_sink.hpp"

#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <unistd.h>

#include <cstdint>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace sitemap::sink {

namespace fs = std::filesystem;

namespace {

bool IsWritable(const fs::path& path) {
  return ::access(path.c_str(), W_OK) == 0;
}

/*
  Truncate and write the target in place. An existing file keeps its inode,
  so links are followed and mode and ownership survive.
*/
SinkResult WriteContent(const fs::path& path, std::string_view content) {
  auto opened = arrow::io::FileOutputStream::Open(path.string());
  if (!opened.ok()) {
    return SinkResult::Err(SinkErrorCode::WriteFailed, "unable to open " + path.string() + ": " + opened.status().ToString());
  }
  auto out = *opened;

  auto status       = out->Write(content.data(), static_cast<int64_t>(content.size()));
  auto close_status = out->Close();
  if (!status.ok() || !close_status.ok()) {
    const auto& failed = status.ok() ? close_status : status;
    return SinkResult::Err(SinkErrorCode::WriteFailed, "unable to save content to " + path.string() + ": " + failed.ToString());
  }

  return SinkResult::Ok();
}

} // namespace

SinkResult DiskFileSink::Write(const fs::path& path, std::string_view content) {
  const fs::path directory = path.has_parent_path() ? path.parent_path() : fs::path{"."};

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    fs::create_directories(directory, ec);
    if (ec) {
      return SinkResult::Err(SinkErrorCode::DirectoryCreationFailed, "failed to create directory " + directory.string() + ": " + ec.message());
    }
    SITEMAP_LOG_INFO("Created output directory", {observability::StringField("directory", directory.string())});
  }

  if (!IsWritable(directory)) {
    return SinkResult::Err(SinkErrorCode::DirectoryNotWritable, "directory is not writable: " + directory.string());
  }

  if (fs::exists(path, ec) && !IsWritable(path)) {
    return SinkResult::Err(SinkErrorCode::FileNotWritable, "file exists and is not writable: " + path.string());
  }

  return WriteContent(path, content);
}

} // namespace sitemap::sink
