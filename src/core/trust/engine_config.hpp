#pragma once

#include "trustpath/common.hpp"
#include "trustpath/error.hpp"
#include "utils/config.hpp"

namespace trustpath::core {

/**
 * EngineConfig - Policy constants for trust computation
 *
 * Defaults:
 *   decay_factor 0.9 keeps a 3-hop chain above 70% of its edge product.
 *   redundancy_penalty 0.5 halves the contribution of a path whose shared
 *   intermediary appears in every path.
 *   Sybil risk blends cluster coefficient 0.25, reciprocity 0.2, edge
 *   creation velocity 0.2, path diversity 0.15 and account age 0.2.
 */
struct EngineConfig {
    // Decay and domains
    double decay_factor = constants::DEFAULT_DECAY_FACTOR;
    double domain_inheritance_discount = constants::DEFAULT_DOMAIN_INHERITANCE_DISCOUNT;
    double wildcard_domain_weight = 1.0;

    // Enumeration bounds
    uint32_t default_max_depth = constants::DEFAULT_MAX_DEPTH;
    uint32_t max_depth_limit = constants::MAX_DEPTH_LIMIT;
    double min_path_confidence = constants::DEFAULT_MIN_PATH_CONFIDENCE;
    uint32_t max_branch_fanout = 64;
    uint32_t parallel_branches = 4;

    // Work budget
    uint64_t max_nodes_visited = 10000;
    uint64_t max_paths = 1000;
    uint64_t query_timeout_ms = 2000;

    // Sybil resistance and confidence
    double redundancy_penalty = constants::DEFAULT_REDUNDANCY_PENALTY;
    double truncation_confidence_factor = 0.5;
    double confidence_diversity_weight = 0.4;
    double confidence_breadth_weight = 0.3;
    double confidence_quality_weight = 0.3;
    double breadth_scale = 2.0;
    uint32_t new_account_days = 30;

    // Sybil risk indicators
    double sybil_cluster_weight = 0.25;
    double sybil_reciprocity_weight = 0.2;
    double sybil_velocity_weight = 0.2;
    double sybil_diversity_weight = 0.15;
    double sybil_age_weight = 0.2;
    double high_cluster_coefficient = 0.8;
    double high_reciprocity = 0.7;
    uint32_t rapid_edge_window_days = 7;
    uint32_t rapid_edge_count = 20;

    // Result cache
    uint64_t cache_ttl_seconds = 3600;
    size_t cache_max_entries = 10000;

    /**
     * Range checks on every field
     * @return ConfigInvalid naming the first offending key
     */
    Result<void> validate() const;

    /**
     * Overlay keys present in the config onto the defaults, then validate
     */
    static Result<EngineConfig> from_config(const utils::Config& config);

    utils::Config to_config() const;
};

} // namespace trustpath::core
