#include "utilities/chunk_store.hpp"
#include "utilities/errors.h"
#include "utilities/ids.h"
#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace xferpress {

static const char *CHUNK_SUFFIX = ".chunk";
static const char *MANIFEST_FILE = "manifest.json";

// ---- MemoryChunkStore ----

void MemoryChunkStore::put(const std::string &uploadId, uint32_t index,
                           const std::vector<std::byte> &data) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_[uploadId][index] = data;
}

std::vector<ChunkInfo>
MemoryChunkStore::listOrdered(const std::string &uploadId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChunkInfo> out;
  auto it = chunks_.find(uploadId);
  if (it == chunks_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto &kv : it->second) {
    out.push_back({kv.first, kv.second.size()});
  }
  return out;
}

std::vector<std::byte> MemoryChunkStore::read(const std::string &uploadId,
                                              uint32_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(uploadId);
  if (it != chunks_.end()) {
    auto c = it->second.find(index);
    if (c != it->second.end()) {
      return c->second;
    }
  }
  throw CompletenessError("Chunk " + std::to_string(index) + " of upload " +
                          uploadId + " is not staged");
}

void MemoryChunkStore::remove(const std::string &uploadId, uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(uploadId);
  if (it == chunks_.end()) {
    return;
  }
  it->second.erase(index);
  if (it->second.empty()) {
    chunks_.erase(it);
  }
}

void MemoryChunkStore::putManifest(const std::string &uploadId,
                                   const UploadManifest &manifest) {
  std::lock_guard<std::mutex> lock(mutex_);
  manifests_[uploadId] = manifest;
}

std::optional<UploadManifest>
MemoryChunkStore::readManifest(const std::string &uploadId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = manifests_.find(uploadId);
  if (it == manifests_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryChunkStore::removeManifest(const std::string &uploadId) {
  std::lock_guard<std::mutex> lock(mutex_);
  manifests_.erase(uploadId);
}

// ---- DiskChunkStore ----

DiskChunkStore::DiskChunkStore(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path
DiskChunkStore::uploadDir(const std::string &uploadId) const {
  // Client-chosen ids may contain path separators; hex keeps them inert.
  return root_ / hexEncode(uploadId);
}

std::filesystem::path DiskChunkStore::chunkPath(const std::string &uploadId,
                                                uint32_t index) const {
  return uploadDir(uploadId) / (std::to_string(index) + CHUNK_SUFFIX);
}

std::filesystem::path
DiskChunkStore::manifestPath(const std::string &uploadId) const {
  return uploadDir(uploadId) / MANIFEST_FILE;
}

void DiskChunkStore::writeAtomically(const std::filesystem::path &target,
                                     const char *data, size_t size,
                                     const std::string &what) const {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path dir = target.parent_path();
  fs::create_directories(dir, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[DiskChunkStore] Cannot create " + dir.string() +
                                  ": " + ec.message());
    throw StorageWriteError("Cannot create staging directory for " + what +
                            ": " + ec.message());
  }

  const fs::path tmp = target.string() + "." + randomHex(4) + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw StorageWriteError("Cannot open " + tmp.string() + " for writing");
    }
    out.write(data, static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throw StorageWriteError("Short write staging " + what);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw StorageWriteError("Cannot move " + what + " into place: " +
                            ec.message());
  }
}

void DiskChunkStore::put(const std::string &uploadId, uint32_t index,
                         const std::vector<std::byte> &data) {
  writeAtomically(chunkPath(uploadId, index),
                  reinterpret_cast<const char *>(data.data()), data.size(),
                  "chunk " + std::to_string(index) + " of upload " + uploadId);
}

std::vector<ChunkInfo>
DiskChunkStore::listOrdered(const std::string &uploadId) const {
  namespace fs = std::filesystem;
  std::vector<ChunkInfo> out;
  std::error_code ec;
  const fs::path dir = uploadDir(uploadId);
  if (!fs::is_directory(dir, ec)) {
    return out;
  }
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec))
      continue;
    const fs::path &p = entry.path();
    if (p.extension().string() != CHUNK_SUFFIX)
      continue;
    const std::string stem = p.stem().string();
    if (stem.empty() || stem.size() > 10 ||
        !std::all_of(stem.begin(), stem.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
      continue;
    unsigned long long idx = std::stoull(stem);
    if (idx > UINT32_MAX)
      continue;
    out.push_back({static_cast<uint32_t>(idx), entry.file_size(ec)});
  }
  std::sort(out.begin(), out.end(),
            [](const ChunkInfo &a, const ChunkInfo &b) { return a.index < b.index; });
  return out;
}

std::vector<std::byte> DiskChunkStore::read(const std::string &uploadId,
                                            uint32_t index) const {
  std::ifstream in(chunkPath(uploadId, index), std::ios::binary);
  if (!in.is_open()) {
    throw CompletenessError("Chunk " + std::to_string(index) + " of upload " +
                            uploadId + " is not staged");
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  std::vector<std::byte> data(tmp.size());
  std::transform(tmp.begin(), tmp.end(), data.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  return data;
}

void DiskChunkStore::remove(const std::string &uploadId, uint32_t index) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::remove(chunkPath(uploadId, index), ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[DiskChunkStore] Failed to remove chunk " +
                                  std::to_string(index) + " of " + uploadId +
                                  ": " + ec.message());
    return;
  }
  removeDirIfEmpty(uploadId);
}

void DiskChunkStore::putManifest(const std::string &uploadId,
                                 const UploadManifest &manifest) {
  nlohmann::json j;
  j["upload_id"] = uploadId;
  j["total"] = manifest.total;
  j["filename"] = manifest.filename;
  const std::string text =
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  writeAtomically(manifestPath(uploadId), text.data(), text.size(),
                  "manifest of upload " + uploadId);
}

std::optional<UploadManifest>
DiskChunkStore::readManifest(const std::string &uploadId) const {
  std::ifstream in(manifestPath(uploadId));
  if (!in.is_open()) {
    return std::nullopt;
  }
  try {
    nlohmann::json j = nlohmann::json::parse(in);
    UploadManifest m;
    m.total = j.at("total").get<uint32_t>();
    m.filename = j.at("filename").get<std::string>();
    if (m.total == 0) {
      throw std::invalid_argument("zero total");
    }
    return m;
  } catch (const nlohmann::json::exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[DiskChunkStore] Unreadable manifest for " +
                                  uploadId + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[DiskChunkStore] Invalid manifest for " +
                                  uploadId + ": " + e.what());
  }
  return std::nullopt;
}

void DiskChunkStore::removeManifest(const std::string &uploadId) {
  std::error_code ec;
  std::filesystem::remove(manifestPath(uploadId), ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[DiskChunkStore] Failed to remove manifest of " +
                                  uploadId + ": " + ec.message());
    return;
  }
  removeDirIfEmpty(uploadId);
}

// Fails harmlessly while chunks or the manifest remain.
void DiskChunkStore::removeDirIfEmpty(const std::string &uploadId) const {
  std::error_code ec;
  const std::filesystem::path dir = uploadDir(uploadId);
  if (std::filesystem::is_empty(dir, ec) && !ec) {
    std::filesystem::remove(dir, ec);
  }
}

} // namespace xferpress
