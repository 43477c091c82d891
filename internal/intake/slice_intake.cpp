#include "slice_intake.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::intake {

using util::ProtocolViolation;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

} // namespace

SliceIntake::SliceIntake(const optiraid::runtime::config::RuntimeConfig& config)
    : config_(config), slice_bytes_(config.layout().slice_size_mib() * kMiB) {
}

std::optional<model::Slice> SliceIntake::Accept(const encoder::SliceEvent& event) {
  const auto& layout = config_.layout();
  const auto  name   = util::DataSliceName(event.basename, event.slice_number, layout.digits(), event.extension);

  if (event.slice_number == last_sequence_ && name == last_name_) {
    OPTIRAID_LOG_WARN("duplicate slice event ignored", {observability::StringField("slice", name)});
    return std::nullopt;
  }

  if (saw_final_) {
    throw ProtocolViolation("slice " + name + " arrived after the final slice");
  }
  if (event.basename != layout.basename()) {
    throw ProtocolViolation("slice basename '" + event.basename + "' does not match configured basename '" + layout.basename() + "'");
  }
  if (event.slice_number != last_sequence_ + 1) {
    throw ProtocolViolation("slice " + std::to_string(event.slice_number) + " out of order, expected " + std::to_string(last_sequence_ + 1));
  }
  if (!encoder::IsKnownContext(event.context)) {
    throw ProtocolViolation("unknown encoder context '" + event.context + "'");
  }

  model::Slice slice;
  slice.basename  = event.basename;
  slice.sequence  = event.slice_number;
  slice.set_index = (event.slice_number - 1) / layout.set_size();
  slice.extension = event.extension;
  slice.path      = event.dir / name;
  slice.is_final  = event.IsFinal();

  if (event.size_bytes) {
    slice.size_bytes = *event.size_bytes;
  } else {
    std::error_code ec;
    slice.size_bytes = std::filesystem::file_size(slice.path, ec);
    if (ec) {
      throw ProtocolViolation("slice " + slice.path.string() + " reported but not readable: " + ec.message());
    }
  }

  if (slice.size_bytes > slice_bytes_) {
    throw ProtocolViolation("slice " + name + " is " + std::to_string(slice.size_bytes) + " bytes, larger than the configured slice size");
  }

  last_sequence_ = slice.sequence;
  last_name_     = name;
  saw_final_     = slice.is_final;

  OPTIRAID_LOG_DEBUG("slice admitted", {observability::StringField("slice", name), observability::IntField("set", static_cast<std::int64_t>(slice.set_index)),
                                        observability::IntField("bytes", static_cast<std::int64_t>(slice.size_bytes))});
  return slice;
}

} // namespace optiraid::intake
