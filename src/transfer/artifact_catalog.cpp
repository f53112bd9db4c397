#include "transfer/artifact_catalog.h"
#include "utilities/errors.h"
#include "utilities/ids.h"
#include "utilities/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace xferpress {

namespace {

nlohmann::json toJson(const CatalogEntry &e) {
  return nlohmann::json{{"id", e.id},
                        {"filename", e.filename},
                        {"category", toString(e.category)},
                        {"size_bytes", e.sizeBytes},
                        {"storage_location", e.storageLocation},
                        {"created_at", static_cast<long long>(e.createdAt)},
                        {"download_count", e.downloadCount}};
}

CatalogEntry fromJson(const nlohmann::json &j) {
  CatalogEntry e;
  e.id = j.at("id").get<std::string>();
  e.filename = j.at("filename").get<std::string>();
  e.category = categoryFromString(j.at("category").get<std::string>());
  e.sizeBytes = j.at("size_bytes").get<uint64_t>();
  e.storageLocation = j.at("storage_location").get<std::string>();
  e.createdAt = static_cast<std::time_t>(j.at("created_at").get<long long>());
  e.downloadCount = j.value("download_count", uint64_t{0});
  return e;
}

} // namespace

ArtifactCatalog::ArtifactCatalog(std::string baseUrl)
    : baseUrl_(std::move(baseUrl)) {
  while (!baseUrl_.empty() && baseUrl_.back() == '/')
    baseUrl_.pop_back();
}

std::string ArtifactCatalog::linkFor(const std::string &id) const {
  return baseUrl_ + "/download/" + id;
}

CatalogEntry ArtifactCatalog::registerArtifact(const std::string &filename,
                                               ContentCategory category,
                                               uint64_t sizeBytes,
                                               const std::string &storageLocation) {
  CatalogEntry entry;
  entry.filename = filename;
  entry.category = category;
  entry.sizeBytes = sizeBytes;
  entry.storageLocation = storageLocation;
  entry.createdAt = std::time(nullptr);

  std::lock_guard<std::mutex> lock(mutex_);
  do {
    entry.id = randomUrlId(16);
  } while (entries_.count(entry.id) != 0);
  entry.downloadLink = linkFor(entry.id);
  entry.sequence = nextSequence_++;
  entries_[entry.id] = entry;
  return entry;
}

CatalogEntry ArtifactCatalog::fetch(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw NotFoundError("No artifact with id " + id);
  }
  ++it->second.downloadCount;
  return it->second;
}

CatalogEntry ArtifactCatalog::lookup(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw NotFoundError("No artifact with id " + id);
  }
  return it->second;
}

std::vector<CatalogEntry> ArtifactCatalog::listRecent(size_t limit) const {
  std::vector<CatalogEntry> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    all.reserve(entries_.size());
    for (const auto &kv : entries_)
      all.push_back(kv.second);
  }
  std::sort(all.begin(), all.end(),
            [](const CatalogEntry &a, const CatalogEntry &b) {
              if (a.createdAt != b.createdAt)
                return a.createdAt > b.createdAt;
              return a.sequence > b.sequence;
            });
  if (all.size() > limit)
    all.resize(limit);
  return all;
}

size_t ArtifactCatalog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ArtifactCatalog::save(const std::string &path) const {
  // Oldest first so load() restores the registration order.
  std::vector<CatalogEntry> ordered = listRecent(static_cast<size_t>(-1));
  std::reverse(ordered.begin(), ordered.end());

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      throw StorageWriteError("Could not open " + tmp + " for writing");
    }
    for (const auto &e : ordered) {
      out << toJson(e).dump() << '\n';
    }
    out.flush();
    if (!out) {
      throw StorageWriteError("Write to " + tmp + " failed");
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::filesystem::remove(tmp, ec);
    throw StorageWriteError("Could not replace " + path);
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[ArtifactCatalog] Saved " +
                                std::to_string(ordered.size()) +
                                " entries to " + path);
}

size_t ArtifactCatalog::load(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    Logger::getInstance().log(LogLevel::DEBUG, "[ArtifactCatalog] No catalog at " +
                                                   path + ", starting empty");
    return 0;
  }
  size_t loaded = 0;
  size_t lineNo = 0;
  std::string line;
  std::lock_guard<std::mutex> lock(mutex_);
  while (std::getline(in, line)) {
    ++lineNo;
    if (line.empty())
      continue;
    try {
      CatalogEntry e = fromJson(nlohmann::json::parse(line));
      e.downloadLink = linkFor(e.id);
      e.sequence = nextSequence_++;
      entries_[e.id] = e;
      ++loaded;
    } catch (const nlohmann::json::exception &ex) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[ArtifactCatalog] Skipping line " +
                                    std::to_string(lineNo) + " of " + path +
                                    ": " + ex.what());
    } catch (const std::invalid_argument &ex) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[ArtifactCatalog] Skipping line " +
                                    std::to_string(lineNo) + " of " + path +
                                    ": " + ex.what());
    }
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "[ArtifactCatalog] Loaded " +
                                std::to_string(loaded) + " entries from " +
                                path);
  return loaded;
}

} // namespace xferpress
