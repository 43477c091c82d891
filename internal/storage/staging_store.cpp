#include "staging_store.hpp"

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace optiraid::storage {

using namespace optiraid::storage::common;

std::shared_ptr<arrow::io::ReadableFile> OpenInput(const std::filesystem::path& path) {
  return Unwrap(arrow::io::ReadableFile::Open(path.string()), path.string());
}

std::shared_ptr<arrow::io::FileOutputStream> OpenOutput(const std::filesystem::path& path) {
  return Unwrap(arrow::io::FileOutputStream::Open(path.string()), path.string());
}

std::string ReadTextFile(const std::filesystem::path& path) {
  auto buffer = ReadAll(OpenInput(path));
  return buffer->ToString();
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view data, bool fsync) {
  const auto tmp_path = TempPathFor(path);

  {
    auto out = OpenOutput(tmp_path);
    Unwrap(out->Write(data.data(), static_cast<int64_t>(data.size())));

    if (fsync) Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, path);
}

void LinkOrCopy(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::remove(to, ec);
  std::filesystem::create_hard_link(from, to, ec);
  if (!ec) {
    return;
  }

  // different filesystem, or one without hard links
  const auto tmp_path = TempPathFor(to);
  std::filesystem::copy_file(from, tmp_path, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::rename(tmp_path, to);
}

} // namespace optiraid::storage
