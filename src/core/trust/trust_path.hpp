#pragma once

#include "trustpath/common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trustpath::core {

enum class TargetKind {
    Principal,
    Subject
};

const char* to_string(TargetKind kind);

/**
 * PathHop - One admitted edge on a path. The domain factor is the
 * inheritance weight of the edge's declared domain for the queried domain.
 */
struct PathHop {
    std::string from;
    std::string to;
    DomainId domain;
    double weight = 0.0;
    double domain_factor = 1.0;

    double effective_weight() const { return weight * domain_factor; }
};

/**
 * CandidatePath - Source-to-target chain of admitted records
 *
 * `principals` starts at the source and ends at the last principal on the
 * path (the target itself for principal targets, the endorser otherwise).
 */
struct CandidatePath {
    std::vector<PrincipalId> principals;
    std::vector<PathHop> hops;
    std::optional<PathHop> endorsement;
    double raw_confidence = 0.0;

    // Trust hops plus the terminal endorsement
    uint32_t hop_count() const {
        return static_cast<uint32_t>(hops.size() + (endorsement ? 1 : 0));
    }

    // Principals followed by the subject, if any
    std::vector<std::string> node_ids() const;

    double weight_product() const;
};

// Highest raw confidence first, ties broken by node-id sequence
bool path_order(const CandidatePath& a, const CandidatePath& b);

} // namespace trustpath::core
