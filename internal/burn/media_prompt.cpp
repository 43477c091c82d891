#include "media_prompt.hpp"

#include <istream>
#include <ostream>
#include <string>

#include "internal/util/errors.hpp"

namespace optiraid::burn {

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {
}

void ConsolePrompt::RequestBlankMedia(const model::DiscBundle& bundle) {
  out_ << "Insert an empty disc for " << bundle.title << " (disc " << bundle.position << " of group " << bundle.group_index
       << ") and press Enter: " << std::flush;
  WaitForEnter();
}

void ConsolePrompt::RequestMounted(const model::DiscBundle& bundle, const std::filesystem::path& mount_point) {
  out_ << "Mount the burned disc " << bundle.title << " at " << mount_point.string() << " and press Enter: " << std::flush;
  WaitForEnter();
}

void ConsolePrompt::WaitForEnter() {
  std::string line;
  if (!std::getline(in_, line)) {
    throw util::InvalidState("operator input closed while waiting for media");
  }
}

} // namespace optiraid::burn
