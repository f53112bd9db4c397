#pragma once
#ifndef XFERPRESS_ARTIFACT_H
#define XFERPRESS_ARTIFACT_H

#include "transfer/content_category.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace xferpress {

/**
 * @brief A file produced by the pipeline, stored on local disk.
 */
struct Artifact {
  std::filesystem::path location;
  std::string originalFilename;
  uint64_t sizeBytes{0};
  ContentCategory category{ContentCategory::Document};
};

} // namespace xferpress

#endif // XFERPRESS_ARTIFACT_H
