#include "planned_slice_source.hpp"

#include "internal/observability/logging.hpp"

namespace optiraid::encoder {

namespace {

constexpr std::uint64_t kMiB            = 1024 * 1024;
constexpr const char*   kSliceExtension = "dar";

std::filesystem::path FindRoot(const std::vector<std::string>& args) {
  std::filesystem::path root = ".";
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if ((arg == "-R" || arg == "--fs-root") && i + 1 < args.size()) {
      root = args[++i];
    } else if (arg.rfind("-R", 0) == 0 && arg.size() > 2) {
      root = arg.substr(2);
    } else if (arg.rfind("--fs-root=", 0) == 0) {
      root = arg.substr(10);
    }
  }
  return root;
}

} // namespace

std::uint64_t EstimateInputBytes(const std::vector<std::string>& encoder_args) {
  const auto root = FindRoot(encoder_args);

  std::error_code ec;
  if (std::filesystem::is_regular_file(root, ec)) {
    return std::filesystem::file_size(root);
  }

  std::uint64_t total = 0;
  auto          it    = std::filesystem::recursive_directory_iterator(root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    OPTIRAID_LOG_WARN("cannot scan encoder root", {observability::StringField("root", root.string()), observability::StringField("error", ec.message())});
    return 0;
  }

  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code size_ec;
    if (it->is_regular_file(size_ec) && !it->is_symlink(size_ec)) {
      const auto size = it->file_size(size_ec);
      if (!size_ec) total += size;
    }
  }
  return total;
}

PlannedSliceSource::PlannedSliceSource(const optiraid::runtime::config::RuntimeConfig& config, std::uint64_t estimated_bytes)
    : config_(config),
      estimated_bytes_(estimated_bytes),
      slice_bytes_(config.layout().slice_size_mib() * kMiB),
      slice_count_(estimated_bytes == 0 ? 1 : (estimated_bytes + slice_bytes_ - 1) / slice_bytes_) {
}

std::optional<SliceEvent> PlannedSliceSource::Next() {
  if (next_ > slice_count_) {
    return std::nullopt;
  }

  SliceEvent event;
  event.dir          = config_.staging().dir();
  event.basename     = config_.layout().basename();
  event.slice_number = next_;
  event.extension    = kSliceExtension;

  const bool last  = next_ == slice_count_;
  event.context    = std::string(last ? kContextLastSlice : kContextOperation);
  event.size_bytes = last ? estimated_bytes_ - (slice_count_ - 1) * slice_bytes_ : slice_bytes_;

  ++next_;
  return event;
}

} // namespace optiraid::encoder
