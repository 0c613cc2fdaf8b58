#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nlquery {

/**
 * @brief TTL-bounded LRU cache of serialized query responses
 *
 * One mutex guards the LRU list and the index; every operation is O(1)
 * amortized. Expired entries are misses and are removed when touched.
 */
class ResultCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 1000;
        std::chrono::milliseconds ttl{300000};
        size_t max_payload_bytes = 1048576;  // 1MB
    };

    struct Hit {
        std::string value;
        std::chrono::milliseconds age{0};
    };

    explicit ResultCache(const Config& config);

    /// Lookup a payload. Returns nullopt on miss, expiry or reset.
    [[nodiscard]] std::optional<Hit> get(const std::string& key);

    /// Insert with the configured TTL
    void put(const std::string& key, std::string value);

    /// Insert with an explicit TTL; oversized payloads are skipped
    void put(const std::string& key, std::string value, std::chrono::milliseconds ttl);

    /// Drop every entry (called when the connection changes)
    void invalidate_all();

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Cache key for a question against a connection
     *
     * Combines the connection identity, the XXH64 fingerprint of the
     * normalized text (lower-cased, whitespace collapsed, trimmed), page and
     * page size.
     */
    [[nodiscard]] static std::string make_key(std::string_view connection_identity,
                                              std::string_view query_text,
                                              size_t page, size_t page_size);

    [[nodiscard]] static uint64_t fingerprint(std::string_view query_text);

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string value;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point expires_at;
    };

    /// Index and list disagree: log, clear, count as a miss. Caller holds mutex_.
    void reset_locked(std::string_view reason);

    Config config_;
    mutable std::mutex mutex_;
    std::list<CacheEntry> lru_list_;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    uint64_t invalidations_ = 0;
};

} // namespace nlquery
