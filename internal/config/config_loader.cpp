#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "internal/parity/par2_codec.hpp"
#include "internal/process/process_runner.hpp"
#include "internal/util/errors.hpp"

namespace optiraid::config {

using optiraid::runtime::config::BurnMode;
using optiraid::runtime::config::ParityCodec;
using optiraid::runtime::config::RuntimeConfig;
using optiraid::util::ConfigurationError;

namespace {

constexpr std::uint32_t kMaxReedSolomonColumns = 255;
constexpr std::uint64_t kMiB                   = 1024 * 1024;

// Most bytes one full set of slice_size slices puts on a single disc. par2
// volumes are larger than the slices they protect, and the index rides on
// the disc of the first volume.
std::uint64_t LargestDiscShare(const RuntimeConfig& config) {
  const auto& layout = config.layout();
  const auto  slice  = layout.slice_size_mib() * kMiB;
  if (config.parity().codec() != runtime::config::PARITY_CODEC_PAR2) return slice;

  // Plan() only does arithmetic; nothing is run
  process::PosixProcessRunner runner;
  parity::Par2Codec           codec(config.parity().program(), static_cast<std::uint64_t>(config.parity().block_size_kib()) * 1024, runner);

  parity::ParityRequest request;
  request.basename = layout.basename();
  request.parity   = layout.parity();
  request.digits   = layout.digits();
  for (std::uint32_t i = 0; i < layout.set_size(); ++i) {
    request.inputs.emplace_back("slice-" + std::to_string(i));
    request.input_sizes.push_back(slice);
  }

  std::vector<std::uint64_t> discs(layout.parity(), 0);
  for (const auto& shard : codec.Plan(request).outputs) {
    discs[shard.role == v1::MEMBER_ROLE_PARITY ? shard.position : 0] += shard.size_bytes;
  }
  return std::max(slice, *std::max_element(discs.begin(), discs.end()));
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0001" must not become 1)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig Finish(RuntimeConfig config) {
  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

bool IsInside(const std::filesystem::path& child, const std::filesystem::path& parent) {
  auto c = std::filesystem::absolute(child).lexically_normal();
  auto p = std::filesystem::absolute(parent).lexically_normal();
  auto mismatch = std::mismatch(p.begin(), p.end(), c.begin(), c.end());
  return mismatch.first == p.end();
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return Finish(ParseYaml(yaml));
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Finish(ParseYaml(yaml));
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* layout = config->mutable_layout();
  if (layout->basename().empty()) layout->set_basename("backup");
  if (layout->disc_size_mib() == 0) layout->set_disc_size_mib(650);
  if (layout->slice_size_mib() == 0) layout->set_slice_size_mib(64);
  if (layout->reserve_mib() == 0) layout->set_reserve_mib(10);
  if (layout->set_size() == 0) layout->set_set_size(4);
  if (layout->parity() == 0) layout->set_parity(1);
  if (layout->digits() == 0) layout->set_digits(4);

  auto* encoder = config->mutable_encoder();
  if (encoder->program().empty()) encoder->set_program("dar");
  if (encoder->compression().empty()) encoder->set_compression("bzip2");
  if (encoder->crypto_block() == 0) encoder->set_crypto_block(131072);

  auto* parity = config->mutable_parity();
  if (parity->codec() == runtime::config::PARITY_CODEC_UNSPECIFIED) parity->set_codec(runtime::config::PARITY_CODEC_REED_SOLOMON);
  if (parity->program().empty()) parity->set_program("par2");
  if (parity->block_size_kib() == 0) parity->set_block_size_kib(1024);

  auto* burn = config->mutable_burn();
  if (burn->mode() == runtime::config::BURN_MODE_UNSPECIFIED) burn->set_mode(runtime::config::BURN_MODE_DEVICE);
  if (burn->program().empty()) burn->set_program("growisofs");
  if (burn->device().empty()) burn->set_device("/dev/sr0");

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& layout = config.layout();

  if (config.staging().dir().empty()) {
    throw ConfigurationError("staging.dir must be set");
  }
  if (layout.basename().find('/') != std::string::npos) {
    throw ConfigurationError("layout.basename must not contain '/'");
  }
  if (layout.set_size() == 0 || layout.parity() == 0) {
    throw ConfigurationError("layout.set_size and layout.parity must be at least 1");
  }
  if (layout.digits() == 0 || layout.digits() > 12) {
    throw ConfigurationError("layout.digits must be between 1 and 12");
  }
  if (layout.disc_size_mib() <= layout.reserve_mib()) {
    throw ConfigurationError("layout.disc_size_mib must exceed layout.reserve_mib");
  }
  if (layout.slice_size_mib() == 0 || layout.slice_size_mib() > layout.disc_size_mib() - layout.reserve_mib()) {
    throw ConfigurationError("layout.slice_size_mib must be positive and fit on one disc after the reserve");
  }
  if (config.parity().codec() == runtime::config::PARITY_CODEC_REED_SOLOMON && layout.set_size() + layout.parity() > kMaxReedSolomonColumns) {
    throw ConfigurationError("layout.set_size + layout.parity must not exceed 255 with the reed-solomon codec");
  }
  const auto capacity = (layout.disc_size_mib() - layout.reserve_mib()) * kMiB;
  if (const auto share = LargestDiscShare(config); share > capacity) {
    throw ConfigurationError("parity for a full set needs " + std::to_string(share) + " bytes on one disc but a disc holds " + std::to_string(capacity) +
                             "; lower layout.slice_size_mib");
  }

  const auto& burn = config.burn();
  if (burn.mode() == runtime::config::BURN_MODE_DIRECTORY) {
    if (burn.output_dir().empty()) {
      throw ConfigurationError("burn.output_dir must be set in directory mode");
    }
    if (IsInside(burn.output_dir(), config.staging().dir())) {
      throw ConfigurationError("burn.output_dir must not be inside staging.dir");
    }
  }
  if (burn.mode() == runtime::config::BURN_MODE_DEVICE && burn.device().empty()) {
    throw ConfigurationError("burn.device must be set in device mode");
  }

  if (!config.ledger().sqlite_path().empty() && IsInside(config.ledger().sqlite_path(), config.staging().dir())) {
    throw ConfigurationError("ledger.sqlite_path must not be inside staging.dir");
  }
}

std::string ConfigLoader::RenderYaml(const RuntimeConfig& config) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "staging" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "dir" << YAML::Value << YAML::DoubleQuoted << config.staging().dir();
  out << YAML::EndMap;

  const auto& layout = config.layout();
  out << YAML::Key << "layout" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "basename" << YAML::Value << YAML::DoubleQuoted << layout.basename();
  out << YAML::Key << "disc_size_mib" << YAML::Value << layout.disc_size_mib();
  out << YAML::Key << "slice_size_mib" << YAML::Value << layout.slice_size_mib();
  out << YAML::Key << "reserve_mib" << YAML::Value << layout.reserve_mib();
  out << YAML::Key << "set_size" << YAML::Value << layout.set_size();
  out << YAML::Key << "parity" << YAML::Value << layout.parity();
  out << YAML::Key << "digits" << YAML::Value << layout.digits();
  out << YAML::EndMap;

  const auto& encoder = config.encoder();
  out << YAML::Key << "encoder" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "program" << YAML::Value << YAML::DoubleQuoted << encoder.program();
  out << YAML::Key << "compression" << YAML::Value << YAML::DoubleQuoted << encoder.compression();
  out << YAML::Key << "crypto_block" << YAML::Value << encoder.crypto_block();
  out << YAML::Key << "extra_args" << YAML::Value << YAML::BeginSeq;
  for (const auto& arg : encoder.extra_args()) {
    out << YAML::DoubleQuoted << arg;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  const auto& parity = config.parity();
  out << YAML::Key << "parity" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "codec" << YAML::Value << runtime::config::ParityCodec_Name(parity.codec());
  out << YAML::Key << "program" << YAML::Value << YAML::DoubleQuoted << parity.program();
  out << YAML::Key << "workers" << YAML::Value << parity.workers();
  out << YAML::Key << "block_size_kib" << YAML::Value << parity.block_size_kib();
  out << YAML::EndMap;

  const auto& burn = config.burn();
  out << YAML::Key << "burn" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "mode" << YAML::Value << runtime::config::BurnMode_Name(burn.mode());
  out << YAML::Key << "device" << YAML::Value << YAML::DoubleQuoted << burn.device();
  out << YAML::Key << "program" << YAML::Value << YAML::DoubleQuoted << burn.program();
  out << YAML::Key << "output_dir" << YAML::Value << YAML::DoubleQuoted << burn.output_dir();
  out << YAML::Key << "prompt_for_media" << YAML::Value << burn.prompt_for_media();
  out << YAML::Key << "verify_mount_point" << YAML::Value << YAML::DoubleQuoted << burn.verify_mount_point();
  out << YAML::EndMap;

  out << YAML::Key << "ledger" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "sqlite_path" << YAML::Value << YAML::DoubleQuoted << config.ledger().sqlite_path();
  out << YAML::EndMap;

  out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "level" << YAML::Value << YAML::DoubleQuoted << config.logging().level();
  out << YAML::Key << "pattern" << YAML::Value << YAML::DoubleQuoted << config.logging().pattern();
  out << YAML::EndMap;

  out << YAML::Key << "docs" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "include_program_copy" << YAML::Value << config.docs().include_program_copy();
  out << YAML::Key << "program_path" << YAML::Value << YAML::DoubleQuoted << config.docs().program_path();
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

} // namespace optiraid::config
