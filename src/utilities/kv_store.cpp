#include "utilities/kv_store.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace xferpress {

std::optional<std::string> MemoryKeyValueStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryKeyValueStore::put(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
}

FileKeyValueStore::FileKeyValueStore(std::string path) : path_(std::move(path)) {
  load();
}

void FileKeyValueStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.clear();
  std::ifstream in(path_);
  if (!in.is_open()) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[FileKeyValueStore] No existing store at " +
                                  path_ + ", starting empty");
    return;
  }
  std::string line;
  size_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (line.empty())
      continue;
    auto sep = line.find(SEPARATOR);
    if (sep == std::string::npos) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[FileKeyValueStore] Skipping malformed line " +
                                    std::to_string(lineNo) + " in " + path_);
      continue;
    }
    values_[line.substr(0, sep)] = line.substr(sep + 1);
  }
}

// Caller holds mutex_.
void FileKeyValueStore::persistLocked() const {
  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      throw StorageWriteError("Could not open " + tmp + " for writing");
    }
    for (const auto &kv : values_) {
      out << kv.first << SEPARATOR << kv.second << '\n';
    }
    out.flush();
    if (!out) {
      throw StorageWriteError("Write to " + tmp + " failed");
    }
  }
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::remove(tmp.c_str());
    throw StorageWriteError("Could not replace " + path_ + ": " + ec.message());
  }
}

void FileKeyValueStore::put(const std::string &key, const std::string &value) {
  if (key.find(SEPARATOR) != std::string::npos ||
      key.find('\n') != std::string::npos ||
      value.find('\n') != std::string::npos) {
    throw std::invalid_argument("key/value contains a reserved character: " +
                                key);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous = values_.find(key);
  std::optional<std::string> old;
  if (previous != values_.end())
    old = previous->second;
  values_[key] = value;
  try {
    persistLocked();
  } catch (const StorageWriteError &) {
    // Keep memory consistent with what is on disk.
    if (old)
      values_[key] = *old;
    else
      values_.erase(key);
    throw;
  }
}

std::optional<std::string> FileKeyValueStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace xferpress
