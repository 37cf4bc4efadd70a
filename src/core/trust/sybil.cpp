#include "core/trust/sybil.hpp"
#include <algorithm>
#include <cmath>

namespace trustpath::core {

namespace {
    constexpr double UPSTREAM_SATURATION = 10.0;
    constexpr double UNKNOWN_AGE_RISK = 0.5;

    double jaccard(const std::set<PrincipalId>& a, const std::set<PrincipalId>& b) {
        if (a.empty() && b.empty()) {
            return 0.0;
        }
        size_t common = 0;
        for (const auto& p : a) {
            common += b.count(p);
        }
        size_t unioned = a.size() + b.size() - common;
        return static_cast<double>(common) / static_cast<double>(unioned);
    }
}

const char* to_string(SybilFlag flag) {
    switch (flag) {
        case SybilFlag::HighClusterCoefficient: return "high_cluster_coefficient";
        case SybilFlag::HighReciprocity: return "high_reciprocity";
        case SybilFlag::RapidEdgeCreation: return "rapid_edge_creation";
        case SybilFlag::NewAccount: return "new_account";
        case SybilFlag::LowPathDiversity: return "low_path_diversity";
        case SybilFlag::NoInboundTrust: return "no_inbound_trust";
        default: return "unknown";
    }
}

bool SybilAssessment::has_flag(SybilFlag flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

SybilScorer::SybilScorer(const EngineConfig& config)
    : config_(config)
{}

SybilAssessment SybilScorer::assess(const SybilSignal& signal) const {
    SybilAssessment assessment;
    assessment.principal = signal.principal;

    if (signal.cluster_coefficient > config_.high_cluster_coefficient) {
        assessment.flags.push_back(SybilFlag::HighClusterCoefficient);
    }
    if (signal.reciprocity > config_.high_reciprocity) {
        assessment.flags.push_back(SybilFlag::HighReciprocity);
    }
    if (signal.recent_edges > config_.rapid_edge_count) {
        assessment.flags.push_back(SybilFlag::RapidEdgeCreation);
    }

    double horizon = static_cast<double>(config_.new_account_days);
    double age_risk = UNKNOWN_AGE_RISK;
    if (signal.account_age_days) {
        age_risk = std::max(0.0, 1.0 - *signal.account_age_days / (2.0 * horizon));
        if (*signal.account_age_days < horizon) {
            assessment.flags.push_back(SybilFlag::NewAccount);
        }
    }

    double diversity_risk = 1.0;
    if (signal.distinct_upstream > 0) {
        diversity_risk = std::max(0.0, 1.0 - signal.distinct_upstream / UPSTREAM_SATURATION);
    }
    if (signal.distinct_upstream < 2) {
        assessment.flags.push_back(SybilFlag::LowPathDiversity);
    }
    if (signal.distinct_upstream == 0) {
        assessment.flags.push_back(SybilFlag::NoInboundTrust);
    }

    double cluster_risk = std::min(1.0, signal.cluster_coefficient / config_.high_cluster_coefficient);
    double reciprocity_risk = std::min(1.0, signal.reciprocity / config_.high_reciprocity);
    double velocity_risk = std::min(1.0, signal.recent_edges / (2.0 * config_.rapid_edge_count));

    double weight_sum = config_.sybil_cluster_weight + config_.sybil_reciprocity_weight +
                        config_.sybil_velocity_weight + config_.sybil_diversity_weight +
                        config_.sybil_age_weight;
    double risk = config_.sybil_cluster_weight * cluster_risk +
                  config_.sybil_reciprocity_weight * reciprocity_risk +
                  config_.sybil_velocity_weight * velocity_risk +
                  config_.sybil_diversity_weight * diversity_risk +
                  config_.sybil_age_weight * age_risk;
    assessment.risk_score = std::min(1.0, risk / weight_sum);
    return assessment;
}

SybilSignal SybilScorer::make_signal(const PrincipalId& principal,
                                     const GraphObservation& observed,
                                     const std::optional<PrincipalInfo>& info,
                                     uint64_t now) const {
    SybilSignal signal;
    signal.principal = principal;

    const auto& upstream = observed.upstream_of(principal);
    signal.distinct_upstream = static_cast<uint32_t>(upstream.size());
    if (info && info->created_at > 0 && info->created_at <= now) {
        signal.account_age_days = static_cast<double>(now - info->created_at) / constants::SECONDS_PER_DAY;
    }

    std::set<PrincipalId> neighbours(upstream.begin(), upstream.end());
    auto out = observed.outgoing.find(principal);
    if (out != observed.outgoing.end()) {
        uint64_t window = static_cast<uint64_t>(config_.rapid_edge_window_days) * constants::SECONDS_PER_DAY;
        uint32_t reciprocated = 0;
        for (const auto& [to, issued_at] : out->second) {
            neighbours.insert(to);
            reciprocated += upstream.count(to);
            if (issued_at <= now && now - issued_at < window) {
                ++signal.recent_edges;
            }
        }
        if (!out->second.empty()) {
            signal.reciprocity = static_cast<double>(reciprocated) / out->second.size();
        }
    }
    neighbours.erase(principal);

    // Edges among neighbours are only known where the neighbour was expanded
    size_t k = neighbours.size();
    if (k >= 2) {
        size_t linked = 0;
        for (const auto& a : neighbours) {
            auto it = observed.outgoing.find(a);
            if (it == observed.outgoing.end()) {
                continue;
            }
            for (const auto& edge : it->second) {
                if (edge.first != a && neighbours.count(edge.first) > 0) {
                    ++linked;
                }
            }
        }
        signal.cluster_coefficient = static_cast<double>(linked) / static_cast<double>(k * (k - 1));
    }
    return signal;
}

std::set<PrincipalId> SybilScorer::contributors(const CandidatePath& path, TargetKind target_kind) {
    std::set<PrincipalId> result;
    if (path.principals.size() < 2) {
        return result;
    }
    size_t end = path.principals.size();
    if (target_kind == TargetKind::Principal) {
        --end;
    }
    for (size_t i = 1; i < end; ++i) {
        result.insert(path.principals[i]);
    }
    return result;
}

std::vector<double> SybilScorer::redundancy_discounts(const std::vector<CandidatePath>& ranked,
                                                      TargetKind target_kind) const {
    std::vector<std::set<PrincipalId>> sets;
    sets.reserve(ranked.size());
    std::map<PrincipalId, size_t> appearances;
    for (const auto& path : ranked) {
        sets.push_back(contributors(path, target_kind));
        for (const auto& p : sets.back()) {
            ++appearances[p];
        }
    }

    std::vector<double> discounts;
    discounts.reserve(ranked.size());
    std::set<PrincipalId> counted;
    double total = static_cast<double>(ranked.size());
    for (const auto& set : sets) {
        double dominance = 0.0;
        for (const auto& p : set) {
            if (counted.count(p) > 0) {
                dominance = std::max(dominance, appearances[p] / total);
            }
        }
        discounts.push_back(1.0 - config_.redundancy_penalty * dominance);
        counted.insert(set.begin(), set.end());
    }
    return discounts;
}

double SybilScorer::confidence(const std::vector<CandidatePath>& ranked,
                               TargetKind target_kind,
                               const std::vector<double>& discounts,
                               const std::map<PrincipalId, SybilAssessment>& assessments,
                               bool truncated) const {
    if (ranked.empty()) {
        return truncated ? 0.0 : 1.0;
    }

    std::vector<std::set<PrincipalId>> sets;
    std::set<PrincipalId> all;
    for (const auto& path : ranked) {
        sets.push_back(contributors(path, target_kind));
        all.insert(sets.back().begin(), sets.back().end());
    }

    // A single path offers no corroboration
    double diversity = 0.0;
    if (sets.size() > 1) {
        double overlap = 0.0;
        size_t pairs = 0;
        for (size_t i = 0; i < sets.size(); ++i) {
            for (size_t j = i + 1; j < sets.size(); ++j) {
                overlap += jaccard(sets[i], sets[j]);
                ++pairs;
            }
        }
        diversity = 1.0 - overlap / static_cast<double>(pairs);
    }

    double effective_paths = 0.0;
    for (size_t i = 0; i < ranked.size(); ++i) {
        effective_paths += i < discounts.size() ? discounts[i] : 1.0;
    }
    double breadth = 1.0 - std::exp(-effective_paths / config_.breadth_scale);

    double quality = 1.0;
    if (!all.empty()) {
        double risk = 0.0;
        for (const auto& p : all) {
            auto it = assessments.find(p);
            risk += it != assessments.end() ? it->second.risk_score : 1.0;
        }
        quality = 1.0 - risk / static_cast<double>(all.size());
    }

    double weight_sum = config_.confidence_diversity_weight +
                        config_.confidence_breadth_weight +
                        config_.confidence_quality_weight;
    double blended = (config_.confidence_diversity_weight * diversity +
                      config_.confidence_breadth_weight * breadth +
                      config_.confidence_quality_weight * quality) / weight_sum;
    if (truncated) {
        blended *= config_.truncation_confidence_factor;
    }
    return std::min(1.0, std::max(0.0, blended));
}

SybilReport SybilScorer::score(const std::vector<CandidatePath>& ranked,
                               TargetKind target_kind,
                               const std::map<PrincipalId, SybilSignal>& signals,
                               bool truncated) const {
    SybilReport report;
    for (const auto& [principal, signal] : signals) {
        report.assessments.emplace(principal, assess(signal));
    }
    report.redundancy_discounts = redundancy_discounts(ranked, target_kind);
    report.confidence = confidence(ranked, target_kind, report.redundancy_discounts,
                                   report.assessments, truncated);
    return report;
}

} // namespace trustpath::core
