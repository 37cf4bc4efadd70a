#pragma once

#include "core/trust/trust_path.hpp"
#include <vector>

namespace trustpath::core {

/**
 * Aggregator - Hop decay and diminishing-returns combination of paths
 *
 * raw(path)  = product of effective weights * d^k, k = hop count
 * combined   = 1 - prod(1 - p_i * r_i)
 *
 * With every p_i * r_i in [0, 1] the combined score never decreases as
 * paths are added.
 */
class Aggregator {
public:
    explicit Aggregator(double decay_factor);

    double decay_factor() const { return decay_factor_; }

    // d^k
    double decay(uint32_t hops) const;

    double raw_confidence(const CandidatePath& path) const;

    // Fill in raw_confidence and order paths by path_order
    void rank(std::vector<CandidatePath>& paths) const;

    /**
     * Combine per-path confidences with their redundancy discounts
     * @param confidences raw confidences, highest first
     * @param discounts r_i, one per confidence; missing entries count as 1
     */
    static double combine(const std::vector<double>& confidences,
                          const std::vector<double>& discounts);

private:
    double decay_factor_;
};

} // namespace trustpath::core
