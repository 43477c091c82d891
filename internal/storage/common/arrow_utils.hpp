#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace optiraid::storage::common {

// Arrow I/O failure on a staged or burned file.
inline std::runtime_error IoError(const arrow::Status& status, std::string_view context) {
  if (context.empty()) return std::runtime_error(status.ToString());
  return std::runtime_error(std::string(context) + ": " + status.ToString());
}

template <typename T>
T Unwrap(const arrow::Result<T>& result, std::string_view context = {}) {
  if (!result.ok()) throw IoError(result.status(), context);
  return *result;
}

inline void Unwrap(const arrow::Status& status, std::string_view context = {}) {
  if (!status.ok()) throw IoError(status, context);
}

inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Streams a file front to back in chunk_bytes pieces; the file is closed
  before returning. Slices are far larger than memory budgets allow to read
  whole, so hashing and verification go through here.
*/
template <typename Fn>
std::uint64_t ForEachChunk(const std::string& path, std::int64_t chunk_bytes, Fn&& fn) {
  auto          file  = Unwrap(arrow::io::ReadableFile::Open(path), path);
  std::uint64_t total = 0;
  while (true) {
    auto chunk = Unwrap(file->Read(chunk_bytes), path);
    if (chunk->size() == 0) break;
    fn(chunk->data(), static_cast<std::size_t>(chunk->size()));
    total += static_cast<std::uint64_t>(chunk->size());
  }
  Unwrap(file->Close(), path);
  return total;
}

} // namespace optiraid::storage::common
