#pragma once
#include "../core/telemetry.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Last decoded value of one register
 */
struct CacheEntry {
  double value{0.0};          ///< decoded value after scale factor
  SystemTime timestamp;       ///< when the value was read from the device
};

/**
 * @brief Shared store of decoded register values keyed by (device, address)
 *
 * The only state shared between pollers and arbitrary readers. Every update
 * replaces a whole entry under an exclusive lock, so readers always see a
 * fully decoded multi-word value, never half of one. Entries are created by
 * the first successful read and only removed with their device; failed polls
 * leave them untouched.
 */
class RegisterCache {
public:
  using Key = std::pair<std::string, std::uint16_t>;

  /**
   * @brief Insert or overwrite an entry
   * @return true if the entry is new or its value changed
   */
  bool upsert(const std::string& device_id, std::uint16_t address, double value, SystemTime timestamp) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(Key{device_id, address}, CacheEntry{value, timestamp});
    if (inserted) return true;
    bool changed = it->second.value != value;
    it->second = CacheEntry{value, timestamp};
    return changed;
  }

  std::optional<CacheEntry> get(const std::string& device_id, std::uint16_t address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(Key{device_id, address});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
  }

  /**
   * @brief All entries of one device, ordered by address
   */
  std::vector<std::pair<std::uint16_t, CacheEntry>> device_entries(const std::string& device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<std::uint16_t, CacheEntry>> out;
    for (auto it = entries_.lower_bound(Key{device_id, 0});
         it != entries_.end() && it->first.first == device_id; ++it) {
      out.emplace_back(it->first.second, it->second);
    }
    return out;
  }

  /// Drop every entry of a device (device removal only)
  std::size_t remove_device(const std::string& device_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    auto it = entries_.lower_bound(Key{device_id, 0});
    while (it != entries_.end() && it->first.first == device_id) {
      it = entries_.erase(it);
      removed++;
    }
    return removed;
  }

  std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
  }

private:
  mutable std::shared_mutex mutex_;
  std::map<Key, CacheEntry> entries_;
};
