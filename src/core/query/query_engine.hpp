#pragma once

#include "core/graph/graph_port.hpp"
#include "core/query/query_types.hpp"
#include "core/query/result_cache.hpp"
#include "core/trust/engine_config.hpp"
#include "core/trust/path_enumerator.hpp"
#include "trustpath/error.hpp"
#include "trustpath/time_utils.hpp"
#include <atomic>
#include <functional>
#include <limits>
#include <future>
#include <map>
#include <memory>
#include <mutex>

namespace trustpath::core {

/**
 * EngineStats - Process-lifetime observability counters
 */
struct EngineStats {
    uint64_t queries = 0;
    uint64_t cache_hits = 0;
    uint64_t coalesced = 0;
    uint64_t computations = 0;
    uint64_t truncated = 0;
    uint64_t port_failures = 0;
    uint64_t rejected_queries = 0;
    uint64_t invalid_signature = 0;
    uint64_t unknown_signer = 0;
    uint64_t expired = 0;
    uint64_t malformed = 0;
    uint64_t domain_mismatch = 0;
    uint64_t invalidations = 0;
};

/**
 * TrustQueryEngine - Entry point for trust queries
 *
 * Each computation runs against one snapshot of the graph port:
 * enumeration, decay and aggregation, then sybil adjustment. Results are
 * cached by (source, target, domain, max depth) and dropped when the port
 * reports a change in a domain the result depends on. Concurrent queries
 * for the same key share one computation; a caller whose shared
 * computation was cancelled by another caller's token computes again.
 *
 * Storage failures surface as PortUnavailable, the only retryable error.
 * Truncated computations return a flagged partial result, never an error.
 */
class TrustQueryEngine {
public:
    using Clock = std::function<uint64_t()>;

    TrustQueryEngine(std::shared_ptr<GraphAccessPort> port,
                     EngineConfig config,
                     Clock clock = &time::timestamp_seconds);
    ~TrustQueryEngine();

    TRUSTPATH_DISALLOW_COPY_AND_MOVE(TrustQueryEngine);

    Result<TrustResult> evaluate(const TrustQuery& query,
                                 const CancellationToken* cancel = nullptr);

    // Change-signal hook; also registered with the port at construction
    void on_graph_change(const GraphChange& change);
    void invalidate_all();

    EngineStats stats() const;
    const EngineConfig& config() const { return config_; }
    size_t cache_size() const { return cache_.size(); }

private:
    Result<uint32_t> validate(const TrustQuery& query) const;
    Result<TrustResult> lead(const CacheKey& key, const TrustQuery& query,
                             const CancellationToken* cancel,
                             std::promise<Result<TrustResult>>& promise);
    Result<TrustResult> compute(const TrustQuery& query, uint32_t max_depth,
                                const CancellationToken* cancel,
                                std::vector<DomainId>& domain_chain,
                                uint64_t& valid_until);
    void release(const CacheKey& key);
    TrustResult self_result(const TrustQuery& query, uint32_t max_depth, uint64_t now) const;
    TrustResult finalize(TrustResult result, const TrustQuery& query, bool from_cache) const;

    std::shared_ptr<GraphAccessPort> port_;
    EngineConfig config_;
    Clock clock_;
    ResultCache cache_;
    SubscriptionId subscription_ = 0;

    std::mutex in_flight_mutex_;
    std::map<CacheKey, std::shared_future<Result<TrustResult>>> in_flight_;

    struct Counters {
        std::atomic<uint64_t> queries{0};
        std::atomic<uint64_t> cache_hits{0};
        std::atomic<uint64_t> coalesced{0};
        std::atomic<uint64_t> computations{0};
        std::atomic<uint64_t> truncated{0};
        std::atomic<uint64_t> port_failures{0};
        std::atomic<uint64_t> rejected_queries{0};
        std::atomic<uint64_t> invalid_signature{0};
        std::atomic<uint64_t> unknown_signer{0};
        std::atomic<uint64_t> expired{0};
        std::atomic<uint64_t> malformed{0};
        std::atomic<uint64_t> domain_mismatch{0};
        std::atomic<uint64_t> invalidations{0};
    };
    Counters counters_;
};

} // namespace trustpath::core
