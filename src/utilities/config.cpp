#include "utilities/config.h"
#include "utilities/errors.h"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace xferpress {

static const char *envOrNull(const char *name) {
  const char *v = std::getenv(name);
  return (v && v[0] != '\0') ? v : nullptr;
}

void applyEnvironmentOverrides(ServiceConfig &cfg) {
  if (const char *env = envOrNull("XFERPRESS_VAR_DIR"))
    cfg.varDir = env;
  if (const char *env = envOrNull("XFERPRESS_BASE_URL"))
    cfg.baseUrl = env;
  if (const char *env = envOrNull("XFERPRESS_COMPRESSION_LEVEL"))
    cfg.compressionLevel = std::atoi(env);
  if (const char *env = envOrNull("XFERPRESS_TRANSCODE_COMMAND"))
    cfg.transcodeCommand = env;
  if (const char *env = envOrNull("XFERPRESS_LOG_LEVEL"))
    cfg.logLevel = env;
}

ServiceConfig loadServiceConfig(const std::string &path) {
  ServiceConfig cfg;
  std::string file = path;
  if (file.empty()) {
    const char *env = envOrNull("XFERPRESS_CONFIG");
    file = env ? env : "xferpress_config.yaml";
  }

  if (std::filesystem::exists(file)) {
    try {
      YAML::Node node = YAML::LoadFile(file);
      if (node["var_dir"])
        cfg.varDir = node["var_dir"].as<std::string>();
      if (node["base_url"])
        cfg.baseUrl = node["base_url"].as<std::string>();
      if (node["compression_level"])
        cfg.compressionLevel = node["compression_level"].as<int>();
      if (node["transcode_command"])
        cfg.transcodeCommand = node["transcode_command"].as<std::string>();
      if (node["log_level"])
        cfg.logLevel = node["log_level"].as<std::string>();
      if (node["log_max_bytes"])
        cfg.logMaxBytes = node["log_max_bytes"].as<long long>();
      if (node["log_backups"])
        cfg.logBackups = node["log_backups"].as<int>();
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid configuration file " + file + ": " +
                        e.what());
    }
  }

  applyEnvironmentOverrides(cfg);

  // Links are built as baseUrl + "/download/<id>".
  while (!cfg.baseUrl.empty() && cfg.baseUrl.back() == '/') {
    cfg.baseUrl.pop_back();
  }
  return cfg;
}

} // namespace xferpress
