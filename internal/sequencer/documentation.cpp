#include "documentation.hpp"

#include <sstream>

#include "internal/encoder/dar_slice_source.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::sequencer {

using optiraid::runtime::config::RuntimeConfig;

namespace {

const char* CodecName(optiraid::runtime::config::ParityCodec codec) {
  switch (codec) {
    case optiraid::runtime::config::PARITY_CODEC_PAR2:
      return "par2";
    case optiraid::runtime::config::PARITY_CODEC_REED_SOLOMON:
      return "reed-solomon (optiraid built-in)";
    default:
      return "unspecified";
  }
}

} // namespace

std::string RenderInvocation(const std::vector<std::string>& command, const std::vector<std::string>& encoder) {
  return util::CommandLine(command) + "\n" + util::CommandLine(encoder) + "\n";
}

std::string RenderOverview(const RuntimeConfig& config, const std::string& invocation) {
  const auto& layout = config.layout();
  const auto  discs  = layout.set_size() + layout.parity();

  std::ostringstream out;
  out << "optiraid backup \"" << layout.basename() << "\"\n"
      << "==========================================\n\n"
      << "This archive was written by " << config.encoder().program() << " in slices of " << layout.slice_size_mib() << " MiB.\n"
      << "Every " << layout.set_size() << " consecutive slices form a redundancy set, protected by " << layout.parity()
      << " parity shard(s) computed with " << CodecName(config.parity().codec()) << ".\n\n"
      << "Discs are written in groups of " << discs << ". In each group, disc 1.." << layout.set_size()
      << " hold data slices (member i of every set on disc i) and disc " << layout.set_size() + 1 << ".." << discs
      << " hold the parity shards. Losing any " << layout.parity() << " disc(s) of a group loses nothing.\n"
      << "Every disc of a group also carries the manifests of all sets in that group, this README and the\n"
      << "configuration the backup was made with (" << kConfigName << ").\n\n"
      << "Restore\n"
      << "-------\n"
      << "1. Copy every readable disc of a group into one directory.\n"
      << "2. Run:  optiraid verify <directory>\n"
      << "   This checks each set against its manifest and rebuilds missing or damaged slices.\n";

  if (config.parity().codec() == optiraid::runtime::config::PARITY_CODEC_PAR2) {
    out << "   Without optiraid:  " << config.parity().program() << " repair <basename>.set-<NNNN>.par2 <slices of that set>\n";
  } else {
    out << "   The manifest (protobuf text) lists every member with its size and SHA-256; parity row i of a set is\n"
        << "   sum_j C[i][j] * slice_j over GF(2^8) (polynomial 0x11d) with C[i][j] = 1 / ((k + i) xor j).\n";
  }

  out << "3. Put all data slices of the archive in one directory and extract:\n"
      << "   " << config.encoder().program() << " -x " << layout.basename() << " -R <target directory>\n\n"
      << "Encoder options (darrc):\n";

  std::istringstream darrc(encoder::RenderDarrc(config));
  for (std::string line; std::getline(darrc, line);) {
    out << "  " << line << "\n";
  }

  if (!invocation.empty()) {
    out << "\nInvocation:\n";
    std::istringstream lines(invocation);
    for (std::string line; std::getline(lines, line);) {
      out << "  " << line << "\n";
    }
  }
  return out.str();
}

std::string RenderReadme(const RuntimeConfig& config, const std::string& invocation, const model::DiscBundle& bundle, std::uint32_t discs_in_group,
                         const std::vector<SetSummary>& sets) {
  std::ostringstream out;
  out << "Disc " << bundle.title << "\n"
      << "This is disc " << bundle.position << " of " << discs_in_group << " in group " << bundle.group_index << " (disc "
      << bundle.disc_index << " overall)";
  if (bundle.pure_parity) out << ", a parity disc";
  out << ".\n\n";

  out << "Files on this disc:\n";
  for (const auto& file : bundle.files) {
    out << "  " << file.name;
    if (file.kind == model::DiscFileKind::kMember) out << "  (" << file.size_bytes << " bytes)";
    out << "\n";
  }

  out << "\nSets in this group:\n";
  for (const auto& set : sets) {
    out << "  set " << util::PadNumber(set.index, config.layout().digits()) << ": data";
    for (const auto& name : set.data) out << " " << name;
    out << "; parity";
    for (const auto& name : set.parity) out << " " << name;
    out << "\n";
  }

  out << "\n" << RenderOverview(config, invocation);
  return out.str();
}

} // namespace optiraid::sequencer
