// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief On-disk snapshot of the last known network list
 *
 * Readers never lock: writes stage the new snapshot in a unique temporary file
 * in the same directory, fsync it and rename() it over the target, so a reader
 * sees either the complete previous snapshot or the complete new one.
 *
 * Only the DaemonLock holder may call write()/publish().
 *
 * File format (JSON):
 * ```
 * {"format": 1, "generation": 7, "scan_timestamp": 1760000000, "count": 2,
 *  "networks": [{"ssid": "...", "security": "WPA2", "signal": 82,
 *                "saved": true, "in_use": true, "last_seen": 1760000000}, ...]}
 * ```
 */
class StateCache {
  public:
    static constexpr int FORMAT_VERSION = 1;

    explicit StateCache(std::string path);

    const std::string& path() const { return path_; }

    /**
     * @brief Load the current snapshot
     *
     * Never throws. Missing, unparseable, wrong-version or inconsistent files
     * all read as empty.
     */
    std::optional<CacheSnapshot> read() const;

    /**
     * @brief Atomically replace the snapshot
     * @return false when the snapshot is inconsistent or the write failed; the
     *         previous file is left intact in both cases
     */
    bool write(const CacheSnapshot& snapshot) const;

    /**
     * @brief Build and write the successor of the current snapshot
     *
     * Records are stamped with @p scan_time and normalized (in-use first, by signal,
     * one entry per SSID). The generation is the on-disk generation plus one.
     *
     * @return The snapshot written, or nullopt if the write failed
     */
    std::optional<CacheSnapshot> publish(std::vector<NetworkRecord> records,
                                         int64_t scan_time) const;

    /// Generation on disk, 0 when empty
    uint64_t current_generation() const;

    /**
     * @brief True when the snapshot is older than @p max_intervals refresh intervals
     */
    static bool is_stale(const CacheSnapshot& snapshot, int64_t now,
                         std::chrono::seconds interval, int max_intervals);

    /// Serialize to the file format above
    static std::string serialize(const CacheSnapshot& snapshot);

    /// Parse the file format; nullopt on any structural or consistency error
    static std::optional<CacheSnapshot> deserialize(const std::string& text);

  private:
    std::string path_;
};

} // namespace wlmenu
