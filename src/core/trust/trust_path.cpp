#include "core/trust/trust_path.hpp"

namespace trustpath::core {

const char* to_string(TargetKind kind) {
    switch (kind) {
        case TargetKind::Principal: return "principal";
        case TargetKind::Subject: return "subject";
        default: return "unknown";
    }
}

std::vector<std::string> CandidatePath::node_ids() const {
    std::vector<std::string> ids(principals.begin(), principals.end());
    if (endorsement) {
        ids.push_back(endorsement->to);
    }
    return ids;
}

double CandidatePath::weight_product() const {
    double product = 1.0;
    for (const auto& hop : hops) {
        product *= hop.effective_weight();
    }
    if (endorsement) {
        product *= endorsement->effective_weight();
    }
    return product;
}

bool path_order(const CandidatePath& a, const CandidatePath& b) {
    if (a.raw_confidence != b.raw_confidence) {
        return a.raw_confidence > b.raw_confidence;
    }
    return a.node_ids() < b.node_ids();
}

} // namespace trustpath::core
