#include "transfer/transfer_service.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <filesystem>
#include <fstream>

namespace xferpress {

TransferService::TransferService(ChunkStore &chunks, Reassembler &reassembler,
                                 CompressorRegistry &compressors,
                                 ArtifactCatalog &catalog)
    : chunks_(chunks), reassembler_(reassembler), compressors_(compressors),
      catalog_(catalog) {}

void TransferService::receiveChunk(const std::string &uploadId, uint32_t index,
                                   uint32_t total, const std::string &filename,
                                   const std::vector<std::byte> &bytes) {
  if (uploadId.empty()) {
    throw ChunkRejectedError("Chunk without upload id");
  }
  if (total == 0 || index >= total) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[TransferService] Rejected chunk " +
                                  std::to_string(index) + "/" +
                                  std::to_string(total) + " for " + uploadId);
    throw ChunkRejectedError("Chunk index " + std::to_string(index) +
                             " outside [0," + std::to_string(total) + ")");
  }
  try {
    admitChunk(uploadId, total, filename);
    chunks_.put(uploadId, index, bytes);
  } catch (const StorageWriteError &e) {
    MetricsRegistry::instance().incrementCounter(
        "xferpress_chunk_write_failures_total");
    Logger::getInstance().log(LogLevel::ERROR,
                              "[TransferService] Chunk " +
                                  std::to_string(index) + " of " + uploadId +
                                  " not stored: " + e.what());
    throw;
  }
  MetricsRegistry::instance().incrementCounter(
      "xferpress_chunks_received_total");
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[TransferService] Stored chunk " +
                                std::to_string(index + 1) + "/" +
                                std::to_string(total) + " for " + uploadId);
}

FinalizeResult TransferService::finalize(const std::string &uploadId,
                                         const std::string &filename) {
  auto guard = uploadLocks_.lock(uploadId);

  std::optional<UploadManifest> session = sessionFor(uploadId);
  if (!session) {
    MetricsRegistry::instance().incrementCounter(
        "xferpress_completeness_failures_total");
    Logger::getInstance().log(LogLevel::WARN,
                              "[TransferService] Finalize for unknown upload " +
                                  uploadId);
    throw CompletenessError("Unknown upload " + uploadId);
  }
  const std::string name = filename.empty() ? session->filename : filename;

  Artifact assembled;
  try {
    assembled = reassembler_.assemble(uploadId, name, session->total);
  } catch (const CompletenessError &) {
    MetricsRegistry::instance().incrementCounter(
        "xferpress_completeness_failures_total");
    throw;
  }
  forgetSession(uploadId);

  CompressionEngine &engine = compressors_.forCategory(assembled.category);
  CompressionOutcome outcome;
  try {
    outcome = engine.compress(assembled);
  } catch (const std::exception &e) {
    // Chunks are already consumed; the reassembled file would be orphaned.
    std::error_code ec;
    std::filesystem::remove(assembled.location, ec);
    std::filesystem::remove(CompressionEngine::outputPathFor(assembled), ec);
    Logger::getInstance().log(LogLevel::ERROR,
                              "[TransferService] Compression of upload " +
                                  uploadId + " failed, discarded " +
                                  assembled.location.string() + ": " +
                                  e.what());
    throw;
  }

  const std::string category = toString(assembled.category);
  if (assembled.sizeBytes > 0) {
    MetricsRegistry::instance().observe(
        "xferpress_compression_ratio",
        static_cast<double>(outcome.artifact.sizeBytes) /
            static_cast<double>(assembled.sizeBytes),
        {{"category", category}});
  }

  CatalogEntry entry = catalog_.registerArtifact(
      name, assembled.category, outcome.artifact.sizeBytes,
      outcome.artifact.location.string());
  MetricsRegistry::instance().incrementCounter(
      "xferpress_uploads_finalized_total", 1.0, {{"category", category}});
  Logger::getInstance().log(LogLevel::INFO,
                            "[TransferService] Upload " + uploadId + " (" +
                                name + ", " + category + ") stored as " +
                                entry.id + ", " +
                                std::to_string(entry.sizeBytes) + " bytes" +
                                (outcome.passthrough ? " uncompressed" : ""));

  return FinalizeResult{entry.id, entry.downloadLink, entry.category,
                        entry.sizeBytes};
}

std::future<FinalizeResult>
TransferService::finalizeAsync(const std::string &uploadId,
                               const std::string &filename) {
  return std::async(std::launch::async, [this, uploadId, filename] {
    return finalize(uploadId, filename);
  });
}

Retrieval TransferService::retrieve(const std::string &id) {
  CatalogEntry entry;
  try {
    entry = catalog_.lookup(id);
  } catch (const NotFoundError &) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[TransferService] Retrieve of unknown id " + id);
    throw;
  }

  auto stream = std::make_unique<std::ifstream>(entry.storageLocation,
                                                std::ios::binary);
  if (!stream->is_open()) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[TransferService] Stored file for " + id +
                                  " is missing: " + entry.storageLocation);
    throw NotFoundError("Stored file for " + id + " is missing");
  }

  entry = catalog_.fetch(id);
  MetricsRegistry::instance().incrementCounter("xferpress_downloads_total");
  Logger::getInstance().log(LogLevel::INFO,
                            "[TransferService] Serving " + id + " (" +
                                entry.filename + "), download #" +
                                std::to_string(entry.downloadCount));
  return Retrieval{entry.filename, std::move(stream), entry.sizeBytes,
                   entry.category};
}

std::vector<UploadSummary> TransferService::recentUploads(size_t limit) const {
  std::vector<UploadSummary> out;
  for (const auto &e : catalog_.listRecent(limit)) {
    out.push_back(UploadSummary{e.id, e.filename, e.sizeBytes, e.createdAt,
                                e.downloadCount});
  }
  return out;
}

void TransferService::admitChunk(const std::string &uploadId, uint32_t total,
                                 const std::string &filename) {
  std::lock_guard<std::mutex> lock(sessionsMutex_);
  auto it = sessions_.find(uploadId);
  if (it == sessions_.end()) {
    std::optional<UploadManifest> staged = chunks_.readManifest(uploadId);
    if (staged) {
      it = sessions_.emplace(uploadId, *staged).first;
    }
  }
  if (it == sessions_.end()) {
    const UploadManifest manifest{total, filename};
    chunks_.putManifest(uploadId, manifest);
    sessions_.emplace(uploadId, manifest);
    return;
  }
  if (it->second.total != total) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[TransferService] Upload " + uploadId +
                                  " declared " +
                                  std::to_string(it->second.total) +
                                  " chunks, got " + std::to_string(total));
    throw ChunkRejectedError("Upload " + uploadId + " already declared " +
                             std::to_string(it->second.total) + " chunks");
  }
}

std::optional<UploadManifest>
TransferService::sessionFor(const std::string &uploadId) {
  std::lock_guard<std::mutex> lock(sessionsMutex_);
  auto it = sessions_.find(uploadId);
  if (it != sessions_.end()) {
    return it->second;
  }
  std::optional<UploadManifest> staged = chunks_.readManifest(uploadId);
  if (staged) {
    Logger::getInstance().log(LogLevel::INFO,
                              "[TransferService] Restored upload " + uploadId +
                                  " from its staged manifest (" +
                                  std::to_string(staged->total) + " chunks)");
    sessions_.emplace(uploadId, *staged);
  }
  return staged;
}

void TransferService::forgetSession(const std::string &uploadId) {
  std::lock_guard<std::mutex> lock(sessionsMutex_);
  sessions_.erase(uploadId);
  chunks_.removeManifest(uploadId);
}

size_t TransferService::pendingUploads() const {
  std::lock_guard<std::mutex> lock(sessionsMutex_);
  return sessions_.size();
}

} // namespace xferpress
