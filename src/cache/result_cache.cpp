#include "cache/result_cache.hpp"
#include "core/utils.hpp"

#define XXH_INLINE_ALL
#include "xxhash.h"

#include <algorithm>
#include <format>

namespace nlquery {

// ============================================================================
// ResultCache
// ============================================================================

ResultCache::ResultCache(const Config& config)
    : config_(config) {
    config_.max_entries = std::max(config_.max_entries, size_t{1});
}

uint64_t ResultCache::fingerprint(std::string_view query_text) {
    const auto normalized = utils::normalize_whitespace_lower(query_text);
    return XXH64(normalized.data(), normalized.size(), 0);
}

std::string ResultCache::make_key(std::string_view connection_identity,
                                  std::string_view query_text,
                                  size_t page, size_t page_size) {
    return std::format("{}|{:016x}|{}|{}", connection_identity,
                       fingerprint(query_text), page, page_size);
}

std::optional<ResultCache::Hit> ResultCache::get(const std::string& key) {
    if (!config_.enabled) return std::nullopt;

    std::lock_guard lock(mutex_);
    if (map_.size() != lru_list_.size()) {
        reset_locked("index and LRU list sizes differ");
        ++misses_;
        return std::nullopt;
    }

    auto it = map_.find(key);
    if (it == map_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto& entry = *it->second;
    if (entry.key != key) {
        reset_locked(std::format("index slot for '{}' points at another entry", key));
        ++misses_;
        return std::nullopt;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= entry.expires_at) {
        lru_list_.erase(it->second);
        map_.erase(it);
        ++expirations_;
        ++misses_;
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    ++hits_;
    return Hit{
        .value = entry.value,
        .age = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.created_at),
    };
}

void ResultCache::put(const std::string& key, std::string value) {
    put(key, std::move(value), config_.ttl);
}

void ResultCache::put(const std::string& key, std::string value, std::chrono::milliseconds ttl) {
    if (!config_.enabled) return;
    // Skip oversized payloads
    if (value.size() > config_.max_payload_bytes) {
        utils::log::debug(std::format("Result of {} bytes not cached", value.size()));
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);

    // If key exists, update it
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = std::move(value);
        it->second->created_at = now;
        it->second->expires_at = now + ttl;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= config_.max_entries && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        ++evictions_;
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(value), now, now + ttl});
    map_[key] = lru_list_.begin();
}

void ResultCache::invalidate_all() {
    std::lock_guard lock(mutex_);
    map_.clear();
    lru_list_.clear();
    ++invalidations_;
}

ResultCache::Stats ResultCache::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .hits = hits_,
        .misses = misses_,
        .evictions = evictions_,
        .expirations = expirations_,
        .invalidations = invalidations_,
        .current_entries = map_.size(),
    };
}

void ResultCache::reset_locked(std::string_view reason) {
    utils::log::error(std::format("Result cache corrupted ({}); resetting", reason));
    map_.clear();
    lru_list_.clear();
    ++invalidations_;
}

} // namespace nlquery
