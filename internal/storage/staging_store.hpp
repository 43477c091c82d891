#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace optiraid::storage {

/*
  Arrow IO file access for staged members, bundle directories and restore
  sets. Writes go to <path>.tmp and are renamed into place, so a reader never
  sees a partial manifest or document.
*/
std::shared_ptr<arrow::io::ReadableFile>     OpenInput(const std::filesystem::path& path);
std::shared_ptr<arrow::io::FileOutputStream> OpenOutput(const std::filesystem::path& path);

std::string ReadTextFile(const std::filesystem::path& path);
void        WriteFileAtomic(const std::filesystem::path& path, std::string_view data, bool fsync);

// Hard-links `from` at `to`, copying when a link is impossible. An existing
// `to` is replaced.
void LinkOrCopy(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace optiraid::storage
