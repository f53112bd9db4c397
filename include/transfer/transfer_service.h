#pragma once
#ifndef XFERPRESS_TRANSFER_SERVICE_H
#define XFERPRESS_TRANSFER_SERVICE_H

#include "transfer/artifact_catalog.h"
#include "transfer/compression_engine.h"
#include "transfer/reassembler.h"
#include "utilities/chunk_store.hpp"
#include "utilities/keyed_mutex.h"

#include <cstddef>
#include <cstdint>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xferpress {

struct FinalizeResult {
  std::string id;
  std::string downloadLink;
  ContentCategory category{ContentCategory::Document};
  uint64_t sizeBytes{0};
};

struct Retrieval {
  std::string filename;
  std::unique_ptr<std::istream> stream;
  uint64_t sizeBytes{0};
  ContentCategory category{ContentCategory::Document}; ///< documents are zstd frames
};

struct UploadSummary {
  std::string id;
  std::string filename;
  uint64_t sizeBytes{0};
  std::time_t createdAt{0};
  uint64_t downloadCount{0};
};

/**
 * @brief Entry point used by the transport layer.
 *
 * Wires chunk staging, reassembly, compression and the catalog together.
 * The declared chunk total and filename of an upload are taken from its
 * first chunk and staged as an UploadManifest next to the chunks, so a
 * service built on the same ChunkStore after a restart can still finalize
 * it. The manifest is dropped once the upload has been reassembled.
 */
class TransferService {
public:
  TransferService(ChunkStore &chunks, Reassembler &reassembler,
                  CompressorRegistry &compressors, ArtifactCatalog &catalog);

  TransferService(const TransferService &) = delete;
  TransferService &operator=(const TransferService &) = delete;

  /**
   * @brief Stage one chunk. Safe to call concurrently, in any order.
   * @throw ChunkRejectedError Empty id, zero total, index out of range or a
   *        total that differs from the one already declared.
   * @throw StorageWriteError The chunk could not be persisted; retry it.
   */
  void receiveChunk(const std::string &uploadId, uint32_t index, uint32_t total,
                    const std::string &filename,
                    const std::vector<std::byte> &bytes);

  /**
   * @brief Reassemble, compress and catalog an upload.
   *
   * At most one finalize per uploadId runs at a time; a second caller waits
   * and then fails because the session has been consumed. @p filename may
   * be empty to reuse the name sent with the chunks.
   *
   * @throw CompletenessError Unknown upload or missing chunks.
   * @throw StorageWriteError The artifact could not be written. The
   *        reassembled file is removed; the client must upload again.
   */
  FinalizeResult finalize(const std::string &uploadId,
                          const std::string &filename);

  /// finalize() on its own task.
  std::future<FinalizeResult> finalizeAsync(const std::string &uploadId,
                                            const std::string &filename);

  /**
   * @brief Open a stored artifact and count the download.
   *
   * The counter is only incremented once the stored file has been opened.
   * @throw NotFoundError Unknown id or missing file.
   */
  Retrieval retrieve(const std::string &id);

  std::vector<UploadSummary> recentUploads(size_t limit) const;

  /// Uploads this instance has received or restored and not yet finalized.
  size_t pendingUploads() const;

private:
  /// Declare or check the upload's manifest. Caller handles StorageWriteError.
  void admitChunk(const std::string &uploadId, uint32_t total,
                  const std::string &filename);
  /// In-memory session or the staged manifest; nullopt for unknown uploads.
  std::optional<UploadManifest> sessionFor(const std::string &uploadId);
  void forgetSession(const std::string &uploadId);

  ChunkStore &chunks_;
  Reassembler &reassembler_;
  CompressorRegistry &compressors_;
  ArtifactCatalog &catalog_;

  mutable std::mutex sessionsMutex_;
  std::unordered_map<std::string, UploadManifest> sessions_;
  KeyedMutex uploadLocks_;
};

} // namespace xferpress

#endif // XFERPRESS_TRANSFER_SERVICE_H
