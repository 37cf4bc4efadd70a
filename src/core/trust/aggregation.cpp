#include "core/trust/aggregation.hpp"
#include <algorithm>
#include <cmath>

namespace trustpath::core {

namespace {
    double clamp_unit(double v) {
        return std::min(1.0, std::max(0.0, v));
    }
}

Aggregator::Aggregator(double decay_factor)
    : decay_factor_(decay_factor)
{}

double Aggregator::decay(uint32_t hops) const {
    return std::pow(decay_factor_, static_cast<double>(hops));
}

double Aggregator::raw_confidence(const CandidatePath& path) const {
    return clamp_unit(path.weight_product() * decay(path.hop_count()));
}

void Aggregator::rank(std::vector<CandidatePath>& paths) const {
    for (auto& path : paths) {
        path.raw_confidence = raw_confidence(path);
    }
    std::sort(paths.begin(), paths.end(), path_order);
}

double Aggregator::combine(const std::vector<double>& confidences,
                           const std::vector<double>& discounts) {
    double remaining = 1.0;
    for (size_t i = 0; i < confidences.size(); ++i) {
        double r = i < discounts.size() ? clamp_unit(discounts[i]) : 1.0;
        remaining *= 1.0 - clamp_unit(confidences[i]) * r;
    }
    return clamp_unit(1.0 - remaining);
}

} // namespace trustpath::core
