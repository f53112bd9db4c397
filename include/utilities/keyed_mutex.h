#pragma once
#ifndef XFERPRESS_KEYED_MUTEX_H
#define XFERPRESS_KEYED_MUTEX_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace xferpress {

/**
 * @brief Mutual exclusion scoped to a string key.
 *
 * Holders of different keys never block each other. Per-key mutexes are
 * created on first use and dropped once the last holder or waiter leaves,
 * so the table only grows with the number of keys currently in use.
 */
class KeyedMutex {
  struct Entry {
    std::mutex mutex;
    std::size_t users{0};
  };

public:
  /** RAII ownership of one key. */
  class Guard {
  public:
    Guard(Guard &&other) noexcept
        : owner_(other.owner_), key_(std::move(other.key_)),
          entry_(other.entry_) {
      other.owner_ = nullptr;
      other.entry_ = nullptr;
    }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard &operator=(Guard &&) = delete;
    ~Guard() {
      if (owner_) {
        owner_->release(key_, entry_);
      }
    }

  private:
    friend class KeyedMutex;
    Guard(KeyedMutex *owner, std::string key, Entry *entry)
        : owner_(owner), key_(std::move(key)), entry_(entry) {}

    KeyedMutex *owner_;
    std::string key_;
    Entry *entry_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex &) = delete;
  KeyedMutex &operator=(const KeyedMutex &) = delete;

  /// Block until @p key is free, then hold it for the guard's lifetime.
  Guard lock(const std::string &key) {
    Entry *entry = nullptr;
    {
      std::lock_guard<std::mutex> lk(tableMutex_);
      auto &slot = entries_[key];
      if (!slot) {
        slot = std::make_unique<Entry>();
      }
      slot->users++;
      entry = slot.get();
    }
    entry->mutex.lock();
    return Guard(this, key, entry);
  }

  /// Number of keys currently held or waited on.
  std::size_t activeKeys() const {
    std::lock_guard<std::mutex> lk(tableMutex_);
    return entries_.size();
  }

private:
  void release(const std::string &key, Entry *entry) {
    entry->mutex.unlock();
    std::lock_guard<std::mutex> lk(tableMutex_);
    if (--entry->users == 0) {
      entries_.erase(key);
    }
  }

  mutable std::mutex tableMutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace xferpress

#endif // XFERPRESS_KEYED_MUTEX_H
