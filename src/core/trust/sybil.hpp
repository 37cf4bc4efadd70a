#pragma once

#include "core/graph/graph_port.hpp"
#include "core/trust/engine_config.hpp"
#include "core/trust/path_enumerator.hpp"
#include "core/trust/trust_path.hpp"
#include <map>
#include <set>

namespace trustpath::core {

enum class SybilFlag {
    HighClusterCoefficient,
    HighReciprocity,
    RapidEdgeCreation,
    NewAccount,
    LowPathDiversity,
    NoInboundTrust
};

const char* to_string(SybilFlag flag);

/**
 * SybilSignal - Per-principal position features, derived per query from the
 * edges the enumerator admitted. Outgoing-edge indicators stay 0 for a
 * principal the walk never expanded.
 */
struct SybilSignal {
    PrincipalId principal;
    uint32_t distinct_upstream = 0;
    std::optional<double> account_age_days;
    double cluster_coefficient = 0.0;   // directed edges among neighbours / k(k-1)
    double reciprocity = 0.0;           // share of outgoing edges trusted back
    uint32_t recent_edges = 0;          // outgoing edges issued inside the window
};

struct SybilAssessment {
    PrincipalId principal;
    double risk_score = 0.0;
    std::vector<SybilFlag> flags;

    bool has_flag(SybilFlag flag) const;
};

struct SybilReport {
    std::vector<double> redundancy_discounts;   // r_i, parallel to the ranked paths
    double confidence = 1.0;
    std::map<PrincipalId, SybilAssessment> assessments;
};

/**
 * SybilScorer - Redundancy discounts and structural confidence for a path set
 *
 * A path's contributors are its principals other than the source and a
 * principal target. The endorser of a subject target is a contributor.
 * A path sharing contributors with higher-ranked paths is discounted by
 * r = 1 - penalty * dominance, where dominance is the largest share of all
 * paths that any shared contributor appears on.
 */
class SybilScorer {
public:
    explicit SybilScorer(const EngineConfig& config);

    /**
     * Weighted blend of normalised indicator risks. Cluster coefficient and
     * reciprocity saturate at their thresholds, velocity at twice the rapid
     * count, diversity at 10 upstream principals and age at twice
     * new_account_days. An unknown age counts as 0.5.
     */
    SybilAssessment assess(const SybilSignal& signal) const;

    SybilSignal make_signal(const PrincipalId& principal,
                            const GraphObservation& observed,
                            const std::optional<PrincipalInfo>& info,
                            uint64_t now) const;

    static std::set<PrincipalId> contributors(const CandidatePath& path, TargetKind target_kind);

    // Paths must already be ranked
    std::vector<double> redundancy_discounts(const std::vector<CandidatePath>& ranked,
                                             TargetKind target_kind) const;

    /**
     * Blend of contributor diversity, discounted breadth and contributor
     * quality. An empty path set is a definite answer (1) unless truncated (0).
     */
    double confidence(const std::vector<CandidatePath>& ranked,
                      TargetKind target_kind,
                      const std::vector<double>& discounts,
                      const std::map<PrincipalId, SybilAssessment>& assessments,
                      bool truncated) const;

    SybilReport score(const std::vector<CandidatePath>& ranked,
                      TargetKind target_kind,
                      const std::map<PrincipalId, SybilSignal>& signals,
                      bool truncated) const;

private:
    const EngineConfig& config_;
};

} // namespace trustpath::core
