#pragma once

#include <string>

#include "config/config.pb.h"

namespace optiraid::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are filled in and the result is validated, so callers
  always receive a complete, immutable configuration.
*/
class ConfigLoader {
 public:
  static optiraid::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static optiraid::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Fills unset fields with the documented defaults.
  static void ApplyDefaults(optiraid::runtime::config::RuntimeConfig* config);

  // Throws util::ConfigurationError describing the first problem found.
  static void Validate(const optiraid::runtime::config::RuntimeConfig& config);

  // Renders the effective configuration back to YAML; loading the output
  // yields an equal message.
  static std::string RenderYaml(const optiraid::runtime::config::RuntimeConfig& config);
};

} // namespace optiraid::config
