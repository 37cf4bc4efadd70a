#pragma once

#include "core/query/query_types.hpp"
#include <limits>
#include <map>
#include <mutex>
#include <tuple>

namespace trustpath::core {

struct CacheKey {
    PrincipalId source;
    std::string target;
    DomainId domain;
    uint32_t max_depth = 0;

    bool operator<(const CacheKey& other) const {
        return std::tie(source, target, domain, max_depth) <
               std::tie(other.source, other.target, other.domain, other.max_depth);
    }
    bool operator==(const CacheKey& other) const {
        return std::tie(source, target, domain, max_depth) ==
               std::tie(other.source, other.target, other.domain, other.max_depth);
    }
};

/**
 * ResultCache - Process-scoped cache of computed trust results
 *
 * Each entry remembers the domain chain it was computed over, so a change
 * in any domain on that chain drops it. A change in "*" drops everything.
 * Inserts carry the generation observed when the computation started and
 * are discarded if any invalidation happened since. An entry also stops
 * being served once the clock reaches its valid_until instant, the first
 * moment one of the records it was computed from expires or becomes live.
 */
class ResultCache {
public:
    ResultCache(uint64_t ttl_seconds, size_t max_entries);

    std::optional<TrustResult> get(const CacheKey& key, uint64_t now);

    // @return false when the entry was rejected as stale
    bool put(const CacheKey& key, const TrustResult& result,
             std::vector<DomainId> domain_chain, uint64_t generation, uint64_t now,
             uint64_t valid_until = std::numeric_limits<uint64_t>::max());

    // Drop entries whose chain contains the domain; returns how many were dropped
    size_t invalidate_domain(const DomainId& domain);
    void invalidate_all();

    uint64_t generation() const;
    size_t size() const;

private:
    struct Entry {
        TrustResult result;
        std::vector<DomainId> domain_chain;
        uint64_t inserted_at;
        uint64_t valid_until;
    };

    void evict_oldest();

    uint64_t ttl_seconds_;
    size_t max_entries_;

    mutable std::mutex mutex_;
    std::map<CacheKey, Entry> entries_;
    uint64_t generation_ = 0;
};

} // namespace trustpath::core
