#pragma once

#include "core/trust/trust_path.hpp"
#include "core/trust/path_enumerator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trustpath::core {

/**
 * TrustQuery - "How much does source trust target within domain?"
 */
struct TrustQuery {
    PrincipalId source;
    std::string target;                      // principal or subject id
    DomainId domain;
    std::optional<uint32_t> max_depth;       // engine default when absent
    std::optional<double> min_confidence;    // post-filter on confidence
};

struct ExplanationEntry {
    std::vector<std::string> path;           // source ... target
    double raw_confidence = 0.0;
    double applied_discount = 0.0;           // 1 - r_i
};

/**
 * QueryStats - What the computation saw and skipped
 */
struct QueryStats {
    uint64_t edges_considered = 0;
    uint64_t invalid_signature = 0;
    uint64_t unknown_signer = 0;
    uint64_t expired = 0;
    uint64_t malformed = 0;
    uint64_t domain_mismatch = 0;
    uint64_t fanout_pruned = 0;
    uint64_t confidence_pruned = 0;
    uint64_t distrust_excluded = 0;
    uint64_t nodes_visited = 0;
    TruncationReason truncation_reason = TruncationReason::None;
};

struct TrustResult {
    double score = 0.0;
    double confidence = 1.0;
    std::vector<ExplanationEntry> explanation;   // ranked, highest confidence first
    uint64_t computed_at = 0;
    bool truncated = false;
    bool below_min_confidence = false;
    bool from_cache = false;
    TargetKind target_kind = TargetKind::Principal;
    uint32_t max_depth = 0;
    QueryStats stats;
};

} // namespace trustpath::core
