#include "core/query/query_engine.hpp"
#include "core/graph/record_gate.hpp"
#include "core/trust/aggregation.hpp"
#include "core/trust/sybil.hpp"
#include "utils/logger.hpp"

namespace trustpath::core {

TrustQueryEngine::TrustQueryEngine(std::shared_ptr<GraphAccessPort> port,
                                   EngineConfig config,
                                   Clock clock)
    : port_(std::move(port))
    , config_(std::move(config))
    , clock_(std::move(clock))
    , cache_(config_.cache_ttl_seconds, config_.cache_max_entries)
{
    if (!port_) {
        throw TrustPathException(ErrorCode::InvalidArgument, "Graph access port is required");
    }
    auto valid = config_.validate();
    if (valid.is_err()) {
        throw ConfigException(valid.error().code(), valid.error().to_string());
    }
    if (!clock_) {
        clock_ = &time::timestamp_seconds;
    }

    subscription_ = port_->subscribe([this](const GraphChange& change) {
        on_graph_change(change);
    });

    TRUSTPATH_LOG_INFO("Trust query engine ready (decay {}, max depth {}/{}, {} workers)",
                       config_.decay_factor, config_.default_max_depth,
                       config_.max_depth_limit, config_.parallel_branches);
}

TrustQueryEngine::~TrustQueryEngine() {
    port_->unsubscribe(subscription_);
}

Result<uint32_t> TrustQueryEngine::validate(const TrustQuery& query) const {
    if (query.source.empty() || query.target.empty() || query.domain.empty()) {
        return Result<uint32_t>::Err(ErrorCode::InvalidArgument,
                                     "source, target and domain are required");
    }
    if (query.min_confidence &&
        !(*query.min_confidence >= 0.0 && *query.min_confidence <= 1.0)) {
        return Result<uint32_t>::Err(ErrorCode::InvalidArgument,
                                     "minConfidence must be in [0, 1]");
    }
    uint32_t depth = query.max_depth.value_or(config_.default_max_depth);
    if (depth == 0) {
        return Result<uint32_t>::Err(ErrorCode::InvalidArgument, "maxDepth must be at least 1");
    }
    if (depth > config_.max_depth_limit) {
        return Result<uint32_t>::Err(ErrorCode::OutOfRange,
                                     "maxDepth exceeds limit of " +
                                     std::to_string(config_.max_depth_limit));
    }
    return Result<uint32_t>::Ok(depth);
}

Result<TrustResult> TrustQueryEngine::evaluate(const TrustQuery& query,
                                               const CancellationToken* cancel) {
    counters_.queries.fetch_add(1);

    auto depth = validate(query);
    if (depth.is_err()) {
        counters_.rejected_queries.fetch_add(1);
        return Result<TrustResult>::Err(depth.error());
    }

    CacheKey key{query.source, query.target, query.domain, depth.value()};
    for (;;) {
        if (auto cached = cache_.get(key, clock_())) {
            counters_.cache_hits.fetch_add(1);
            return Result<TrustResult>::Ok(finalize(std::move(*cached), query, true));
        }

        // Single flight: the first caller for a key computes, later callers wait
        std::promise<Result<TrustResult>> promise;
        std::shared_future<Result<TrustResult>> pending;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) {
                pending = it->second;
            } else {
                in_flight_.emplace(key, promise.get_future().share());
                leader = true;
            }
        }
        if (leader) {
            return lead(key, query, cancel, promise);
        }

        counters_.coalesced.fetch_add(1);
        const auto& shared = pending.get();
        if (shared.is_err()) {
            return Result<TrustResult>::Err(shared.error());
        }
        // The leader's cancellation belongs to the leader's caller
        if (shared.value().stats.truncation_reason == TruncationReason::Cancelled &&
            !(cancel && cancel->is_cancelled())) {
            TRUSTPATH_LOG_DEBUG("Shared computation for {} -> {} was cancelled; retrying",
                                short_id(query.source), short_id(query.target));
            continue;
        }
        return Result<TrustResult>::Ok(finalize(shared.value(), query, false));
    }
}

Result<TrustResult> TrustQueryEngine::lead(const CacheKey& key, const TrustQuery& query,
                                           const CancellationToken* cancel,
                                           std::promise<Result<TrustResult>>& promise) {
    uint64_t generation = cache_.generation();
    std::vector<DomainId> domain_chain;
    uint64_t valid_until = std::numeric_limits<uint64_t>::max();
    Result<TrustResult> computed = Result<TrustResult>::Err(ErrorCode::Unknown, "not computed");
    try {
        computed = compute(query, key.max_depth, cancel, domain_chain, valid_until);
    } catch (const std::exception&) {
        release(key);
        promise.set_exception(std::current_exception());
        throw;
    }

    if (computed.is_ok() && !computed.value().truncated) {
        if (!cache_.put(key, computed.value(), domain_chain, generation, clock_(), valid_until)) {
            TRUSTPATH_LOG_DEBUG("Result for {} -> {} not cached: graph changed or records "
                                "reached their validity bound during computation",
                                short_id(query.source), short_id(query.target));
        }
    }
    // Released first so a follower that retries starts a fresh computation
    release(key);
    promise.set_value(computed);

    if (computed.is_err()) {
        return computed;
    }
    return Result<TrustResult>::Ok(finalize(std::move(computed.value()), query, false));
}

void TrustQueryEngine::release(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(key);
}

Result<TrustResult> TrustQueryEngine::compute(const TrustQuery& query, uint32_t max_depth,
                                              const CancellationToken* cancel,
                                              std::vector<DomainId>& domain_chain,
                                              uint64_t& valid_until) {
    uint64_t now = clock_();
    time::Timer timer;
    try {
        auto snapshot = port_->open_snapshot();
        if (!snapshot) {
            throw StorageException(ErrorCode::PortUnavailable, "no snapshot available");
        }
        auto domains = snapshot->domains();
        if (!domains || !domains->contains(query.domain)) {
            counters_.rejected_queries.fetch_add(1);
            return Result<TrustResult>::Err(ErrorCode::UnknownDomain,
                                            "Unknown domain '" + query.domain + "'");
        }
        domain_chain = domains->chain(query.domain);

        if (query.source == query.target) {
            return Result<TrustResult>::Ok(self_result(query, max_depth, now));
        }

        counters_.computations.fetch_add(1);

        TargetKind target_kind = snapshot->is_subject(query.target)
            ? TargetKind::Subject : TargetKind::Principal;

        RecordGate gate(snapshot, now);
        PathEnumerator enumerator(snapshot, gate, config_, cancel);
        EnumerationRequest request{query.source, query.target, target_kind, query.domain, max_depth};
        EnumerationResult enumeration = enumerator.enumerate(request);

        const auto& paths = enumeration.paths;
        bool truncated = enumeration.stats.truncated;

        SybilScorer scorer(config_);
        std::map<PrincipalId, SybilSignal> signals;
        for (const auto& path : paths) {
            for (const auto& principal : SybilScorer::contributors(path, target_kind)) {
                if (signals.count(principal) > 0) {
                    continue;
                }
                signals.emplace(principal, scorer.make_signal(
                    principal, enumeration.observed, snapshot->principal_info(principal), now));
            }
        }

        SybilReport report = scorer.score(paths, target_kind, signals, truncated);

        std::vector<double> confidences;
        confidences.reserve(paths.size());
        for (const auto& path : paths) {
            confidences.push_back(path.raw_confidence);
        }

        TrustResult result;
        result.score = Aggregator::combine(confidences, report.redundancy_discounts);
        result.confidence = report.confidence;
        result.computed_at = now;
        result.truncated = truncated;
        result.target_kind = target_kind;
        result.max_depth = max_depth;
        for (size_t i = 0; i < paths.size(); ++i) {
            ExplanationEntry entry;
            entry.path = paths[i].node_ids();
            entry.raw_confidence = paths[i].raw_confidence;
            entry.applied_discount = 1.0 - report.redundancy_discounts[i];
            result.explanation.push_back(std::move(entry));
        }

        GateStats gate_stats = gate.stats();
        valid_until = gate.validity_horizon();
        result.stats.edges_considered = gate_stats.records_considered;
        result.stats.invalid_signature = gate_stats.invalid_signature;
        result.stats.unknown_signer = gate_stats.unknown_signer;
        result.stats.expired = gate_stats.expired;
        result.stats.malformed = gate_stats.malformed;
        result.stats.domain_mismatch = enumeration.stats.domain_mismatch;
        result.stats.fanout_pruned = enumeration.stats.fanout_pruned;
        result.stats.confidence_pruned = enumeration.stats.confidence_pruned;
        result.stats.distrust_excluded = enumeration.stats.distrust_excluded;
        result.stats.nodes_visited = enumeration.stats.nodes_visited;
        result.stats.truncation_reason = enumeration.stats.truncation_reason;

        counters_.invalid_signature.fetch_add(gate_stats.invalid_signature);
        counters_.unknown_signer.fetch_add(gate_stats.unknown_signer);
        counters_.expired.fetch_add(gate_stats.expired);
        counters_.malformed.fetch_add(gate_stats.malformed);
        counters_.domain_mismatch.fetch_add(enumeration.stats.domain_mismatch);
        if (truncated) {
            counters_.truncated.fetch_add(1);
        }

        TRUSTPATH_LOG_DEBUG("Trust {} -> {} in '{}': score {:.4f}, confidence {:.4f}, {} paths ({} ms)",
                            short_id(query.source), short_id(query.target), query.domain,
                            result.score, result.confidence, paths.size(),
                            timer.elapsed_milliseconds());
        return Result<TrustResult>::Ok(std::move(result));
    } catch (const StorageException& e) {
        counters_.port_failures.fetch_add(1);
        TRUSTPATH_LOG_ERROR("Graph access failed for {} -> {}: {}",
                            short_id(query.source), short_id(query.target), e.what());
        return Result<TrustResult>::Err(Error(ErrorCode::PortUnavailable,
                                              "Graph store unavailable", e.what()));
    }
}

TrustResult TrustQueryEngine::self_result(const TrustQuery& query, uint32_t max_depth,
                                          uint64_t now) const {
    TrustResult result;
    result.score = 1.0;
    result.confidence = 1.0;
    result.computed_at = now;
    result.max_depth = max_depth;
    ExplanationEntry entry;
    entry.path = {query.source};
    entry.raw_confidence = 1.0;
    entry.applied_discount = 0.0;
    result.explanation.push_back(std::move(entry));
    return result;
}

TrustResult TrustQueryEngine::finalize(TrustResult result, const TrustQuery& query,
                                       bool from_cache) const {
    result.from_cache = from_cache;
    result.below_min_confidence = false;
    // Reported, not suppressed: callers still see the confidence and paths
    if (query.min_confidence && result.confidence < *query.min_confidence) {
        result.score = 0.0;
        result.below_min_confidence = true;
    }
    return result;
}

void TrustQueryEngine::on_graph_change(const GraphChange& change) {
    counters_.invalidations.fetch_add(1);
    if (change.kind == GraphChange::Kind::Domain || change.kind == GraphChange::Kind::PrincipalKey) {
        cache_.invalidate_all();
        TRUSTPATH_LOG_DEBUG("Cache cleared after {} change",
                            change.kind == GraphChange::Kind::Domain ? "domain" : "principal key");
        return;
    }
    size_t dropped = cache_.invalidate_domain(change.domain);
    TRUSTPATH_LOG_DEBUG("Dropped {} cached results for domain '{}'", dropped, change.domain);
}

void TrustQueryEngine::invalidate_all() {
    cache_.invalidate_all();
}

EngineStats TrustQueryEngine::stats() const {
    EngineStats s;
    s.queries = counters_.queries.load();
    s.cache_hits = counters_.cache_hits.load();
    s.coalesced = counters_.coalesced.load();
    s.computations = counters_.computations.load();
    s.truncated = counters_.truncated.load();
    s.port_failures = counters_.port_failures.load();
    s.rejected_queries = counters_.rejected_queries.load();
    s.invalid_signature = counters_.invalid_signature.load();
    s.unknown_signer = counters_.unknown_signer.load();
    s.expired = counters_.expired.load();
    s.malformed = counters_.malformed.load();
    s.domain_mismatch = counters_.domain_mismatch.load();
    s.invalidations = counters_.invalidations.load();
    return s;
}

} // namespace trustpath::core
