#pragma once
#ifndef XFERPRESS_REASSEMBLER_H
#define XFERPRESS_REASSEMBLER_H

#include "transfer/artifact.h"
#include "utilities/chunk_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace xferpress {

/**
 * @brief Turns the staged chunks of one upload into a single artifact.
 *
 * Not safe for concurrent calls on the same uploadId; callers serialise
 * per upload.
 */
class Reassembler {
public:
  Reassembler(ChunkStore &store, std::filesystem::path artifactsDir);

  /**
   * @brief Verify and concatenate the chunks of @p uploadId.
   *
   * Completeness is checked before anything is written: the staged indices
   * must be exactly [0, total). Chunks are then appended in index order and
   * each one is removed from the store as soon as it has been written, so
   * only one chunk is resident at a time.
   *
   * A crash part way through leaves the consumed chunks deleted and a
   * truncated output; a later call for the same upload fails with
   * CompletenessError.
   *
   * @throw CompletenessError Missing, extra or out-of-range chunks.
   * @throw StorageWriteError Output file cannot be written.
   */
  Artifact assemble(const std::string &uploadId, const std::string &filename,
                    uint32_t total);

  /// Replace every character outside [A-Za-z0-9.-] with '_'.
  static std::string sanitizeFilename(const std::string &filename);

  const std::filesystem::path &artifactsDir() const { return artifactsDir_; }

private:
  ChunkStore &store_;
  std::filesystem::path artifactsDir_;
};

} // namespace xferpress

#endif // XFERPRESS_REASSEMBLER_H
