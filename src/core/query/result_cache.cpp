#include "core/query/result_cache.hpp"
#include "core/domain/domain_index.hpp"
#include <algorithm>

namespace trustpath::core {

ResultCache::ResultCache(uint64_t ttl_seconds, size_t max_entries)
    : ttl_seconds_(ttl_seconds)
    , max_entries_(max_entries)
{}

std::optional<TrustResult> ResultCache::get(const CacheKey& key, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const Entry& entry = it->second;
    if (now < entry.inserted_at || now - entry.inserted_at >= ttl_seconds_ ||
        now >= entry.valid_until) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.result;
}

bool ResultCache::put(const CacheKey& key, const TrustResult& result,
                      std::vector<DomainId> domain_chain, uint64_t generation, uint64_t now,
                      uint64_t valid_until) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || now >= valid_until) {
        return false;
    }
    if (entries_.find(key) == entries_.end() && entries_.size() >= max_entries_) {
        evict_oldest();
    }
    entries_[key] = Entry{result, std::move(domain_chain), now, valid_until};
    return true;
}

size_t ResultCache::invalidate_domain(const DomainId& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    if (DomainIndex::is_wildcard(domain)) {
        size_t dropped = entries_.size();
        entries_.clear();
        return dropped;
    }
    size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& chain = it->second.domain_chain;
        if (std::find(chain.begin(), chain.end(), domain) != chain.end()) {
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void ResultCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    entries_.clear();
}

uint64_t ResultCache::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResultCache::evict_oldest() {
    auto oldest = std::min_element(entries_.begin(), entries_.end(),
        [](const auto& a, const auto& b) {
            return a.second.inserted_at < b.second.inserted_at;
        });
    if (oldest != entries_.end()) {
        entries_.erase(oldest);
    }
}

} // namespace trustpath::core
