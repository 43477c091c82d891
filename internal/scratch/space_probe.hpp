#pragma once

#include <cstdint>
#include <filesystem>

namespace optiraid::scratch {

class FreeSpaceProbe {
 public:
  virtual ~FreeSpaceProbe() = default;

  // Bytes available to an unprivileged writer at `path` or, when it does not
  // exist yet, at its nearest existing ancestor.
  virtual std::uint64_t FreeBytes(const std::filesystem::path& path) = 0;
};

class StatvfsProbe final : public FreeSpaceProbe {
 public:
  std::uint64_t FreeBytes(const std::filesystem::path& path) override;
};

// Reports a fixed figure; for tests and capacity planning.
class FixedSpaceProbe final : public FreeSpaceProbe {
 public:
  explicit FixedSpaceProbe(std::uint64_t bytes) : bytes_(bytes) {
  }

  std::uint64_t FreeBytes(const std::filesystem::path&) override {
    return bytes_;
  }

  void Set(std::uint64_t bytes) {
    bytes_ = bytes;
  }

 private:
  std::uint64_t bytes_;
};

std::filesystem::path NearestExistingAncestor(const std::filesystem::path& path);

} // namespace optiraid::scratch
