#pragma once
#ifndef XFERPRESS_ARTIFACT_CATALOG_H
#define XFERPRESS_ARTIFACT_CATALOG_H

#include "transfer/content_category.h"

#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace xferpress {

struct CatalogEntry {
  std::string id;
  std::string filename;
  ContentCategory category{ContentCategory::Document};
  uint64_t sizeBytes{0};
  std::string storageLocation;
  std::string downloadLink;
  std::time_t createdAt{0};
  uint64_t downloadCount{0};
  uint64_t sequence{0}; ///< registration order, breaks createdAt ties
};

/**
 * @brief Index of stored artifacts keyed by a generated identifier.
 *
 * Entries are never removed. Only downloadCount changes after
 * registration.
 */
class ArtifactCatalog {
public:
  explicit ArtifactCatalog(std::string baseUrl);

  /// Create an entry with a fresh id and `<baseUrl>/download/<id>` link.
  CatalogEntry registerArtifact(const std::string &filename,
                                ContentCategory category, uint64_t sizeBytes,
                                const std::string &storageLocation);

  /**
   * @brief Count one download of @p id and return the updated entry.
   * @throw NotFoundError For unknown ids.
   */
  CatalogEntry fetch(const std::string &id);

  /// Like fetch() without touching downloadCount.
  CatalogEntry lookup(const std::string &id) const;

  /// Newest first, at most @p limit entries.
  std::vector<CatalogEntry> listRecent(size_t limit) const;

  size_t size() const;
  const std::string &baseUrl() const { return baseUrl_; }

  /**
   * @brief Write every entry to @p path as JSON lines.
   * @throw StorageWriteError If the file cannot be written.
   */
  void save(const std::string &path) const;

  /**
   * @brief Merge entries from a file written by save().
   *
   * A missing file is not an error. Malformed lines are logged and
   * skipped.
   * @return Number of entries loaded.
   */
  size_t load(const std::string &path);

private:
  std::string linkFor(const std::string &id) const;

  std::string baseUrl_;
  mutable std::mutex mutex_;
  std::map<std::string, CatalogEntry> entries_;
  uint64_t nextSequence_{0};
};

} // namespace xferpress

#endif // XFERPRESS_ARTIFACT_CATALOG_H
