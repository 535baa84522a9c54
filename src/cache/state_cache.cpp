// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_cache.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace wlmenu {

namespace {

/// Write all of @p data to @p fd, retrying on EINTR and short writes
bool write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

StateCache::StateCache(std::string path) : path_(std::move(path)) {}

// ============================================================================
// Serialization
// ============================================================================

std::string StateCache::serialize(const CacheSnapshot& snapshot) {
    json networks = json::array();
    for (const auto& rec : snapshot.networks) {
        networks.push_back({{"ssid", rec.ssid},
                            {"security", security_name(rec.security)},
                            {"signal", rec.signal_strength},
                            {"saved", rec.saved},
                            {"in_use", rec.in_use},
                            {"last_seen", rec.last_seen}});
    }

    json doc = {{"format", FORMAT_VERSION},
                {"generation", snapshot.generation},
                {"scan_timestamp", snapshot.scan_timestamp},
                {"count", snapshot.networks.size()},
                {"networks", std::move(networks)}};
    return doc.dump(2) + "\n";
}

std::optional<CacheSnapshot> StateCache::deserialize(const std::string& text) {
    json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    try {
        if (doc.value("format", 0) != FORMAT_VERSION) {
            return std::nullopt;
        }

        CacheSnapshot snap;
        snap.generation = doc.at("generation").get<uint64_t>();
        snap.scan_timestamp = doc.at("scan_timestamp").get<int64_t>();

        const json& networks = doc.at("networks");
        if (!networks.is_array() || networks.size() != doc.at("count").get<size_t>()) {
            return std::nullopt;
        }

        snap.networks.reserve(networks.size());
        for (const auto& n : networks) {
            NetworkRecord rec;
            rec.ssid = n.at("ssid").get<std::string>();
            rec.security = security_from_name(n.at("security").get<std::string>());
            rec.signal_strength = n.at("signal").get<int>();
            rec.saved = n.at("saved").get<bool>();
            rec.in_use = n.at("in_use").get<bool>();
            rec.last_seen = n.at("last_seen").get<int64_t>();
            snap.networks.push_back(std::move(rec));
        }

        if (!snap.is_consistent()) {
            return std::nullopt;
        }
        return snap;
    } catch (const json::exception& e) {
        spdlog::debug("[StateCache] Malformed snapshot: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// File access
// ============================================================================

std::optional<CacheSnapshot> StateCache::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::trace("[StateCache] No snapshot at {}", path_);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    auto snap = deserialize(buffer.str());
    if (!snap) {
        spdlog::warn("[StateCache] Ignoring unreadable snapshot at {}", path_);
    }
    return snap;
}

bool StateCache::write(const CacheSnapshot& snapshot) const {
    if (!snapshot.is_consistent()) {
        spdlog::error("[StateCache] Refusing to write inconsistent snapshot (gen {})",
                      snapshot.generation);
        return false;
    }

    std::string data = serialize(snapshot);

    // Same directory as the target so rename() stays atomic
    std::string tmpl = path_ + ".XXXXXX";
    int fd = mkstemp(&tmpl[0]);
    if (fd < 0) {
        spdlog::error("[StateCache] Cannot create temp file for {}: {}", path_, strerror(errno));
        return false;
    }

    bool ok = write_all(fd, data) && fchmod(fd, 0644) == 0 && fsync(fd) == 0;
    int saved_errno = errno;
    if (close(fd) != 0) {
        ok = false;
        saved_errno = errno;
    }

    if (!ok) {
        spdlog::error("[StateCache] Failed to write {}: {}", tmpl, strerror(saved_errno));
        unlink(tmpl.c_str());
        return false;
    }

    if (std::rename(tmpl.c_str(), path_.c_str()) != 0) {
        spdlog::error("[StateCache] rename {} -> {} failed: {}", tmpl, path_, strerror(errno));
        unlink(tmpl.c_str());
        return false;
    }

    spdlog::debug("[StateCache] Wrote generation {} ({} networks)", snapshot.generation,
                  snapshot.networks.size());
    return true;
}

std::optional<CacheSnapshot> StateCache::publish(std::vector<NetworkRecord> records,
                                                 int64_t scan_time) const {
    CacheSnapshot snap;
    snap.generation = current_generation() + 1;
    snap.scan_timestamp = scan_time;
    snap.networks = normalize_records(std::move(records));
    for (auto& rec : snap.networks) {
        rec.last_seen = scan_time;
    }

    if (!write(snap)) {
        return std::nullopt;
    }
    return snap;
}

uint64_t StateCache::current_generation() const {
    auto snap = read();
    return snap ? snap->generation : 0;
}

bool StateCache::is_stale(const CacheSnapshot& snapshot, int64_t now,
                          std::chrono::seconds interval, int max_intervals) {
    int64_t limit = static_cast<int64_t>(interval.count()) * std::max(1, max_intervals);
    return now - snapshot.scan_timestamp > limit;
}

} // namespace wlmenu
