#pragma once

#include <string>

#include "config/config.pb.h"

namespace logship::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static logship::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  /*
    Environment wins over the file:
      LICENSE_KEY, NR_REGION                      -> ingest
      AWS_LAMBDA_FUNCTION_NAME,
      AWS_LAMBDA_LOG_GROUP_NAME,
      AWS_LAMBDA_LOG_STREAM_NAME                  -> invocation
  */
  static void ApplyEnvironmentOverrides(logship::runtime::config::RuntimeConfig* config);
};

} // namespace logship::config
