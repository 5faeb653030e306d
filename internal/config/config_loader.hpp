#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/coordination/coordination_options.hpp"
#include "internal/service/service_options.hpp"

namespace claims::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected and durations use the protobuf JSON form ("300s", "1.5s").
*/
class ConfigLoader {
 public:
  static claims::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static claims::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Unset fields keep the option struct defaults. Throws std::invalid_argument on out-of-range values.
service::ServiceOptions                ToServiceOptions(const claims::runtime::config::RuntimeConfig& config);
coordination::WorkStealingOptions      ToWorkStealingOptions(const claims::runtime::config::RuntimeConfig& config);
coordination::ExpiryOptions            ToExpiryOptions(const claims::runtime::config::RuntimeConfig& config);

} // namespace claims::config
