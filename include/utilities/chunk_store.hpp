#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xferpress {

/// Descriptor of one staged chunk.
struct ChunkInfo {
  uint32_t index{0};
  uint64_t sizeBytes{0};
};

/// What the first chunk of an upload declared.
struct UploadManifest {
  uint32_t total{0};
  std::string filename;
};

/**
 * @brief Staging area for upload chunks keyed by (uploadId, index).
 *
 * put() for distinct indices of the same upload may run concurrently. The
 * upload manifest is staged next to the chunks so an upload can be
 * finalized by a different process than the one that received it.
 */
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  /**
   * @brief Store a chunk, replacing any previous content for the same pair.
   * @throw StorageWriteError If the chunk could not be persisted.
   */
  virtual void put(const std::string &uploadId, uint32_t index,
                   const std::vector<std::byte> &data) = 0;

  /**
   * @brief Chunks staged for @p uploadId sorted by numeric index.
   * @return Empty when nothing is staged.
   */
  virtual std::vector<ChunkInfo> listOrdered(const std::string &uploadId) const = 0;

  /**
   * @brief Load one chunk.
   * @throw CompletenessError If the chunk is not staged.
   */
  virtual std::vector<std::byte> read(const std::string &uploadId,
                                      uint32_t index) const = 0;

  /// Delete one chunk. No-op if absent.
  virtual void remove(const std::string &uploadId, uint32_t index) = 0;

  /**
   * @brief Record the declared total and filename of an upload.
   * @throw StorageWriteError If the manifest could not be persisted.
   */
  virtual void putManifest(const std::string &uploadId,
                           const UploadManifest &manifest) = 0;

  /// Manifest of @p uploadId, or nullopt if none is staged or it is unreadable.
  virtual std::optional<UploadManifest>
  readManifest(const std::string &uploadId) const = 0;

  /// Delete the manifest. No-op if absent.
  virtual void removeManifest(const std::string &uploadId) = 0;
};

/**
 * @brief In-process chunk store. Nothing survives a restart.
 */
class MemoryChunkStore : public ChunkStore {
public:
  void put(const std::string &uploadId, uint32_t index,
           const std::vector<std::byte> &data) override;
  std::vector<ChunkInfo> listOrdered(const std::string &uploadId) const override;
  std::vector<std::byte> read(const std::string &uploadId,
                              uint32_t index) const override;
  void remove(const std::string &uploadId, uint32_t index) override;
  void putManifest(const std::string &uploadId,
                   const UploadManifest &manifest) override;
  std::optional<UploadManifest>
  readManifest(const std::string &uploadId) const override;
  void removeManifest(const std::string &uploadId) override;

private:
  mutable std::mutex mutex_;
  // Ordered inner map keeps listOrdered() numeric.
  std::unordered_map<std::string, std::map<uint32_t, std::vector<std::byte>>>
      chunks_;
  std::unordered_map<std::string, UploadManifest> manifests_;
};

/**
 * @brief Chunk store backed by the local filesystem.
 *
 * Layout: `<root>/<hex(uploadId)>/<index>.chunk` plus `manifest.json` in
 * the same directory. Writes go to a unique temporary file that is renamed
 * into place, so a retried put replaces the previous content atomically.
 */
class DiskChunkStore : public ChunkStore {
public:
  explicit DiskChunkStore(std::filesystem::path root);

  void put(const std::string &uploadId, uint32_t index,
           const std::vector<std::byte> &data) override;
  std::vector<ChunkInfo> listOrdered(const std::string &uploadId) const override;
  std::vector<std::byte> read(const std::string &uploadId,
                              uint32_t index) const override;
  void remove(const std::string &uploadId, uint32_t index) override;
  void putManifest(const std::string &uploadId,
                   const UploadManifest &manifest) override;
  std::optional<UploadManifest>
  readManifest(const std::string &uploadId) const override;
  void removeManifest(const std::string &uploadId) override;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path uploadDir(const std::string &uploadId) const;
  std::filesystem::path manifestPath(const std::string &uploadId) const;
  void writeAtomically(const std::filesystem::path &target,
                       const char *data, size_t size,
                       const std::string &what) const;
  void removeDirIfEmpty(const std::string &uploadId) const;
  std::filesystem::path chunkPath(const std::string &uploadId,
                                  uint32_t index) const;

  std::filesystem::path root_;
};

} // namespace xferpress

#endif // CHUNK_STORE_HPP
