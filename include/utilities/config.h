#pragma once
#ifndef XFERPRESS_CONFIG_H
#define XFERPRESS_CONFIG_H

#include <string>

namespace xferpress {

/**
 * @brief Runtime options shared by every pipeline component.
 *
 * Built once by the process entry point and handed to components at
 * construction. All state directories hang off #varDir.
 */
struct ServiceConfig {
  std::string varDir = "var/xferpress";
  std::string baseUrl = "http://localhost:4000";
  int compressionLevel = 3; ///< zstd level for documents
  /// Command used for video transcoding. {input}, {output} and {crf} are
  /// substituted with shell-quoted values.
  std::string transcodeCommand =
      "ffmpeg -y -loglevel error -i {input} -vcodec libx264 -crf {crf} "
      "-f mp4 {output}";
  std::string logLevel = "info";
  long long logMaxBytes = 10 * 1024 * 1024;
  int logBackups = 5;

  std::string stagingDir() const { return varDir + "/chunks"; }
  std::string artifactsDir() const { return varDir + "/uploads"; }
  std::string logsDir() const { return varDir + "/logs"; }
  std::string qualityStorePath() const { return varDir + "/quality.dat"; }
  std::string catalogPath() const { return varDir + "/catalog.jsonl"; }
  std::string adjustmentsPath() const { return varDir + "/adjustments.jsonl"; }
};

/**
 * @brief Load configuration from YAML then apply environment overrides.
 *
 * @param path YAML file. When empty, `XFERPRESS_CONFIG` or
 *        `xferpress_config.yaml` is used. A missing file yields defaults.
 * @throw ConfigError If the file exists but cannot be parsed.
 */
ServiceConfig loadServiceConfig(const std::string &path = "");

/// Apply `XFERPRESS_*` environment variables on top of @p cfg.
void applyEnvironmentOverrides(ServiceConfig &cfg);

} // namespace xferpress

#endif // XFERPRESS_CONFIG_H
