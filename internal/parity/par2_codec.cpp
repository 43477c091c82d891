#include "par2_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::parity {

namespace {

// par2 caps the number of source blocks
constexpr std::uint64_t kMaxBlocks = 32768;

std::uint32_t Digits(std::uint64_t value) {
  std::uint32_t digits = 1;
  for (auto t = value; t >= 10; t /= 10) ++digits;
  return digits;
}

// par2cmdline: <stem>.vol<exponent>+<count>.par2, both zero padded to the
// widest value among the recovery files.
std::string VolumeName(const std::string& stem, std::uint64_t exponent, std::uint64_t count, std::uint32_t low_digits, std::uint32_t count_digits) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), ".vol%0*llu+%0*llu.par2", static_cast<int>(low_digits), static_cast<unsigned long long>(exponent),
                static_cast<int>(count_digits), static_cast<unsigned long long>(count));
  return stem + buffer;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

std::uint64_t Par2OverheadBytes(std::size_t files) {
  return static_cast<std::uint64_t>(std::ceil(270519.0 + 230648.0 * std::exp(-0.195 * static_cast<double>(files))));
}

Par2Codec::Par2Codec(std::string program, std::uint64_t block_bytes, process::ProcessRunner& runner)
    : program_(std::move(program)), block_bytes_(block_bytes), runner_(runner) {
  // par2 block sizes are multiples of 4
  if (block_bytes_ == 0 || block_bytes_ % 4 != 0) {
    throw util::ConfigurationError("par2 block size must be a positive multiple of 4");
  }
}

std::uint64_t Par2Codec::BlocksPerFile(std::uint64_t largest) const {
  return std::max<std::uint64_t>(1, (largest + block_bytes_ - 1) / block_bytes_);
}

ParityResult Par2Codec::Plan(const ParityRequest& request) const {
  ParityResult result;

  std::uint64_t largest = 0;
  for (auto size : request.input_sizes) largest = std::max(largest, size);

  const auto stem         = util::SetStem(request.basename, request.set_index, request.digits);
  const auto per_file     = BlocksPerFile(largest);
  const auto low_digits   = Digits(per_file * (request.parity - 1));
  const auto count_digits = Digits(per_file);
  const auto overhead     = Par2OverheadBytes(request.inputs.size());

  for (std::uint32_t i = 0; i < request.parity; ++i) {
    model::ParityShard shard;
    shard.name       = VolumeName(stem, per_file * i, per_file, low_digits, count_digits);
    shard.path       = request.output_dir / shard.name;
    shard.size_bytes = per_file * block_bytes_ + overhead;
    shard.position   = i;
    shard.role       = v1::MEMBER_ROLE_PARITY;
    result.outputs.push_back(std::move(shard));
  }

  model::ParityShard index;
  index.name       = stem + ".par2";
  index.path       = request.output_dir / index.name;
  index.size_bytes = overhead;
  index.position   = 0;
  index.role       = v1::MEMBER_ROLE_INDEX;
  result.outputs.push_back(std::move(index));
  return result;
}

ParityResult Par2Codec::Generate(const ParityRequest& request) {
  auto result = Plan(request);

  std::uint64_t largest = 0;
  for (auto size : request.input_sizes) largest = std::max(largest, size);
  const auto per_file = BlocksPerFile(largest);

  std::uint64_t source_blocks = 0;
  for (auto size : request.input_sizes) source_blocks += std::max<std::uint64_t>(1, (size + block_bytes_ - 1) / block_bytes_);
  if (source_blocks > kMaxBlocks || per_file * request.parity > kMaxBlocks) {
    throw util::ConfigurationError("par2 block size too small for set " + std::to_string(request.set_index) + ": raise parity.block_size_kib");
  }

  const auto index_name = util::SetStem(request.basename, request.set_index, request.digits) + ".par2";

  std::vector<std::string> argv = {program_,
                                   "create",
                                   "-q",
                                   "-q",
                                   "-n" + std::to_string(request.parity),
                                   "-c" + std::to_string(per_file * request.parity),
                                   "-s" + std::to_string(block_bytes_),
                                   "-u",
                                   index_name};
  for (const auto& input : request.inputs) {
    argv.push_back(input.filename().string());
  }

  auto tool = runner_.Run(argv, request.output_dir);
  if (!tool.ok()) {
    for (const auto& output : result.outputs) RemoveQuietly(output.path);
    process::ThrowIfFailed(tool, request.set_index);
  }

  for (auto& output : result.outputs) {
    std::error_code ec;
    output.size_bytes = std::filesystem::file_size(output.path, ec);
    if (ec) {
      for (const auto& o : result.outputs) RemoveQuietly(o.path);
      throw util::ExternalToolFailure(tool.CommandLine(), tool.exit_code, "expected output " + output.name + " was not produced", request.set_index);
    }
  }
  return result;
}

void Par2Codec::Repair(const RepairRequest& request) {
  if (!request.manifest) throw std::invalid_argument("repair request without manifest");
  const auto& manifest = *request.manifest;

  const std::set<std::string> damaged(request.damaged.begin(), request.damaged.end());

  std::size_t                      lost_data   = 0;
  std::size_t                      lost_parity = 0;
  std::vector<std::string>         data_names;
  std::optional<std::string>       par_file;
  for (const auto& member : manifest.members()) {
    const bool lost = damaged.contains(member.name());
    if (member.role() == v1::MEMBER_ROLE_DATA) {
      data_names.push_back(member.name());
      if (lost) ++lost_data;
    } else if (member.role() == v1::MEMBER_ROLE_PARITY) {
      if (lost) {
        ++lost_parity;
      } else if (!par_file) {
        par_file = member.name();
      }
    } else if (member.role() == v1::MEMBER_ROLE_INDEX && !lost) {
      par_file = member.name();
    }
  }

  if (lost_data == 0) {
    if (lost_parity > 0) {
      OPTIRAID_LOG_WARN("par2 recovery files damaged, data intact", {observability::IntField("set", static_cast<std::int64_t>(manifest.set_index()))});
    }
    return;
  }
  if (lost_data > manifest.parity() - lost_parity || !par_file) {
    throw util::Unrecoverable(manifest.set_index(), lost_data + lost_parity, manifest.parity());
  }

  // corrupt inputs must not be mistaken for good ones by a partial repair
  for (const auto& name : request.damaged) {
    if (std::filesystem::exists(request.dir / name) && std::find(data_names.begin(), data_names.end(), name) != data_names.end()) {
      std::filesystem::rename(request.dir / name, request.dir / (name + ".damaged"));
    }
  }

  std::vector<std::string> argv = {program_, "repair", "-q", "-q", *par_file};
  for (const auto& name : data_names) argv.push_back(name);
  for (const auto& name : request.damaged) {
    if (std::filesystem::exists(request.dir / (name + ".damaged"))) argv.push_back(name + ".damaged");
  }

  process::ThrowIfFailed(runner_.Run(argv, request.dir), manifest.set_index());

  for (const auto& name : request.damaged) {
    RemoveQuietly(request.dir / (name + ".damaged"));
    RemoveQuietly(request.dir / (name + ".1"));
  }
}

} // namespace optiraid::parity
