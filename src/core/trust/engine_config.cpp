#include "core/trust/engine_config.hpp"
#include <type_traits>

namespace trustpath::core {

namespace {
    Result<void> invalid(const std::string& key, const std::string& constraint) {
        return Result<void>::Err(Error(ErrorCode::ConfigInvalid,
                                       "Invalid value for '" + key + "'", constraint));
    }

    bool in_unit(double v) { return v >= 0.0 && v <= 1.0; }
}

Result<void> EngineConfig::validate() const {
    if (!(decay_factor > 0.0 && decay_factor < 1.0)) {
        return invalid("decay_factor", "must be in (0, 1)");
    }
    if (!(domain_inheritance_discount > 0.0 && domain_inheritance_discount <= 1.0)) {
        return invalid("domain_inheritance_discount", "must be in (0, 1]");
    }
    if (!in_unit(wildcard_domain_weight)) {
        return invalid("wildcard_domain_weight", "must be in [0, 1]");
    }
    if (max_depth_limit == 0) {
        return invalid("max_depth_limit", "must be at least 1");
    }
    if (default_max_depth == 0 || default_max_depth > max_depth_limit) {
        return invalid("default_max_depth", "must be in [1, max_depth_limit]");
    }
    if (!in_unit(min_path_confidence)) {
        return invalid("min_path_confidence", "must be in [0, 1]");
    }
    if (max_branch_fanout == 0) {
        return invalid("max_branch_fanout", "must be at least 1");
    }
    if (parallel_branches == 0) {
        return invalid("parallel_branches", "must be at least 1");
    }
    if (max_nodes_visited == 0) {
        return invalid("max_nodes_visited", "must be at least 1");
    }
    if (max_paths == 0) {
        return invalid("max_paths", "must be at least 1");
    }
    if (!in_unit(redundancy_penalty)) {
        return invalid("redundancy_penalty", "must be in [0, 1]");
    }
    if (!in_unit(truncation_confidence_factor)) {
        return invalid("truncation_confidence_factor", "must be in [0, 1]");
    }
    if (confidence_diversity_weight < 0.0 || confidence_breadth_weight < 0.0 ||
        confidence_quality_weight < 0.0) {
        return invalid("confidence_*_weight", "must be non-negative");
    }
    if (confidence_diversity_weight + confidence_breadth_weight + confidence_quality_weight <= 0.0) {
        return invalid("confidence_*_weight", "at least one weight must be positive");
    }
    if (!(breadth_scale > 0.0)) {
        return invalid("breadth_scale", "must be positive");
    }
    if (new_account_days == 0) {
        return invalid("new_account_days", "must be at least 1");
    }
    if (sybil_cluster_weight < 0.0 || sybil_reciprocity_weight < 0.0 || sybil_velocity_weight < 0.0 ||
        sybil_diversity_weight < 0.0 || sybil_age_weight < 0.0) {
        return invalid("sybil_*_weight", "must be non-negative");
    }
    if (sybil_cluster_weight + sybil_reciprocity_weight + sybil_velocity_weight +
        sybil_diversity_weight + sybil_age_weight <= 0.0) {
        return invalid("sybil_*_weight", "at least one weight must be positive");
    }
    if (!(high_cluster_coefficient > 0.0 && high_cluster_coefficient <= 1.0)) {
        return invalid("high_cluster_coefficient", "must be in (0, 1]");
    }
    if (!(high_reciprocity > 0.0 && high_reciprocity <= 1.0)) {
        return invalid("high_reciprocity", "must be in (0, 1]");
    }
    if (rapid_edge_window_days == 0) {
        return invalid("rapid_edge_window_days", "must be at least 1");
    }
    if (rapid_edge_count == 0) {
        return invalid("rapid_edge_count", "must be at least 1");
    }
    if (cache_max_entries == 0) {
        return invalid("cache_max_entries", "must be at least 1");
    }
    return Result<void>::Ok();
}

Result<EngineConfig> EngineConfig::from_config(const utils::Config& config) {
    EngineConfig c;

    // A key that is present but has the wrong type is rejected, not defaulted
    std::string bad_key;
    auto read = [&](const char* key, auto& field) {
        using T = std::decay_t<decltype(field)>;
        if (!config.has(key)) {
            return;
        }
        auto value = config.get<T>(key);
        if (!value) {
            if (bad_key.empty()) bad_key = key;
            return;
        }
        field = *value;
    };

    read("decay_factor", c.decay_factor);
    read("domain_inheritance_discount", c.domain_inheritance_discount);
    read("wildcard_domain_weight", c.wildcard_domain_weight);
    read("default_max_depth", c.default_max_depth);
    read("max_depth_limit", c.max_depth_limit);
    read("min_path_confidence", c.min_path_confidence);
    read("max_branch_fanout", c.max_branch_fanout);
    read("parallel_branches", c.parallel_branches);
    read("max_nodes_visited", c.max_nodes_visited);
    read("max_paths", c.max_paths);
    read("query_timeout_ms", c.query_timeout_ms);
    read("redundancy_penalty", c.redundancy_penalty);
    read("truncation_confidence_factor", c.truncation_confidence_factor);
    read("confidence_diversity_weight", c.confidence_diversity_weight);
    read("confidence_breadth_weight", c.confidence_breadth_weight);
    read("confidence_quality_weight", c.confidence_quality_weight);
    read("breadth_scale", c.breadth_scale);
    read("new_account_days", c.new_account_days);
    read("sybil_cluster_weight", c.sybil_cluster_weight);
    read("sybil_reciprocity_weight", c.sybil_reciprocity_weight);
    read("sybil_velocity_weight", c.sybil_velocity_weight);
    read("sybil_diversity_weight", c.sybil_diversity_weight);
    read("sybil_age_weight", c.sybil_age_weight);
    read("high_cluster_coefficient", c.high_cluster_coefficient);
    read("high_reciprocity", c.high_reciprocity);
    read("rapid_edge_window_days", c.rapid_edge_window_days);
    read("rapid_edge_count", c.rapid_edge_count);
    read("cache_ttl_seconds", c.cache_ttl_seconds);
    read("cache_max_entries", c.cache_max_entries);

    if (!bad_key.empty()) {
        return Result<EngineConfig>::Err(Error(ErrorCode::ConfigInvalid,
                                               "Invalid value for '" + bad_key + "'",
                                               "wrong type"));
    }

    auto valid = c.validate();
    if (valid.is_err()) {
        return Result<EngineConfig>::Err(valid.error());
    }
    return Result<EngineConfig>::Ok(c);
}

utils::Config EngineConfig::to_config() const {
    utils::Config config;
    config.set("decay_factor", decay_factor);
    config.set("domain_inheritance_discount", domain_inheritance_discount);
    config.set("wildcard_domain_weight", wildcard_domain_weight);
    config.set("default_max_depth", default_max_depth);
    config.set("max_depth_limit", max_depth_limit);
    config.set("min_path_confidence", min_path_confidence);
    config.set("max_branch_fanout", max_branch_fanout);
    config.set("parallel_branches", parallel_branches);
    config.set("max_nodes_visited", max_nodes_visited);
    config.set("max_paths", max_paths);
    config.set("query_timeout_ms", query_timeout_ms);
    config.set("redundancy_penalty", redundancy_penalty);
    config.set("truncation_confidence_factor", truncation_confidence_factor);
    config.set("confidence_diversity_weight", confidence_diversity_weight);
    config.set("confidence_breadth_weight", confidence_breadth_weight);
    config.set("confidence_quality_weight", confidence_quality_weight);
    config.set("breadth_scale", breadth_scale);
    config.set("new_account_days", new_account_days);
    config.set("sybil_cluster_weight", sybil_cluster_weight);
    config.set("sybil_reciprocity_weight", sybil_reciprocity_weight);
    config.set("sybil_velocity_weight", sybil_velocity_weight);
    config.set("sybil_diversity_weight", sybil_diversity_weight);
    config.set("sybil_age_weight", sybil_age_weight);
    config.set("high_cluster_coefficient", high_cluster_coefficient);
    config.set("high_reciprocity", high_reciprocity);
    config.set("rapid_edge_window_days", rapid_edge_window_days);
    config.set("rapid_edge_count", rapid_edge_count);
    config.set("cache_ttl_seconds", cache_ttl_seconds);
    config.set("cache_max_entries", cache_max_entries);
    return config;
}

} // namespace trustpath::core
