#pragma once
#ifndef XFERPRESS_KV_STORE_H
#define XFERPRESS_KV_STORE_H

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace xferpress {

/**
 * @brief Minimal string key/value persistence contract.
 *
 * Implementations must be safe for concurrent use.
 */
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  /// Stored value, or std::nullopt when absent.
  virtual std::optional<std::string> get(const std::string &key) const = 0;

  /**
   * @brief Insert or replace a value.
   * @throw StorageWriteError If the value cannot be persisted.
   */
  virtual void put(const std::string &key, const std::string &value) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
  std::optional<std::string> get(const std::string &key) const override;
  void put(const std::string &key, const std::string &value) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

/**
 * @brief Key/value store persisted as `key|value` lines.
 *
 * The whole file is loaded on construction and rewritten (via a temporary
 * file and rename) on every put. Keys may not contain '|' or newlines;
 * values may not contain newlines.
 */
class FileKeyValueStore : public KeyValueStore {
public:
  static constexpr char SEPARATOR = '|';

  explicit FileKeyValueStore(std::string path);

  std::optional<std::string> get(const std::string &key) const override;
  void put(const std::string &key, const std::string &value) override;

  const std::string &path() const { return path_; }

private:
  void load();
  void persistLocked() const;

  std::string path_;
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

} // namespace xferpress

#endif // XFERPRESS_KV_STORE_H
