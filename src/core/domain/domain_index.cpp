#include "core/domain/domain_index.hpp"
#include <algorithm>
#include <cmath>

namespace trustpath::core {

Result<void> DomainIndex::add(const Domain& domain) {
    if (domain.id.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Domain id must not be empty");
    }
    if (is_wildcard(domain.id)) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "The wildcard domain is implicit");
    }

    if (domain.parent && !is_wildcard(*domain.parent)) {
        if (*domain.parent == domain.id) {
            return Result<void>::Err(ErrorCode::CyclicDomainHierarchy,
                                     "Domain '" + domain.id + "' cannot be its own parent");
        }
        if (!contains(*domain.parent)) {
            return Result<void>::Err(ErrorCode::UnknownDomain,
                                     "Unknown parent domain '" + *domain.parent + "'");
        }
        // Walk up from the new parent; reaching the domain itself means a loop
        for (const auto& ancestor : chain(*domain.parent)) {
            if (ancestor == domain.id) {
                return Result<void>::Err(ErrorCode::CyclicDomainHierarchy,
                                         "Re-parenting '" + domain.id + "' under '" +
                                         *domain.parent + "' creates a cycle");
            }
        }
    }

    Domain stored = domain;
    if (stored.parent && is_wildcard(*stored.parent)) {
        stored.parent.reset();
    }
    if (stored.name.empty()) {
        stored.name = stored.id;
    }
    domains_[stored.id] = std::move(stored);
    return Result<void>::Ok();
}

Result<void> DomainIndex::add_all(const std::vector<Domain>& domains) {
    for (const auto& domain : domains) {
        TRUSTPATH_TRY(add(domain));
    }
    return Result<void>::Ok();
}

bool DomainIndex::remove(const DomainId& id) {
    auto it = domains_.find(id);
    if (it == domains_.end()) {
        return false;
    }
    // Children are lifted to the removed domain's parent
    auto parent = it->second.parent;
    for (auto& [child_id, child] : domains_) {
        if (child.parent && *child.parent == id) {
            child.parent = parent;
        }
    }
    domains_.erase(it);
    return true;
}

bool DomainIndex::contains(const DomainId& id) const {
    return is_wildcard(id) || domains_.count(id) > 0;
}

std::optional<Domain> DomainIndex::get(const DomainId& id) const {
    auto it = domains_.find(id);
    if (it == domains_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Domain> DomainIndex::all() const {
    std::vector<Domain> result;
    result.reserve(domains_.size());
    for (const auto& [id, domain] : domains_) {
        result.push_back(domain);
    }
    std::sort(result.begin(), result.end(),
              [](const Domain& a, const Domain& b) { return a.id < b.id; });
    return result;
}

std::vector<DomainId> DomainIndex::ancestors(const DomainId& id) const {
    std::vector<DomainId> result;
    auto it = domains_.find(id);
    // Bounded by the forest size so a corrupted index cannot spin forever
    while (it != domains_.end() && it->second.parent && result.size() < domains_.size()) {
        const DomainId& parent = *it->second.parent;
        result.push_back(parent);
        it = domains_.find(parent);
    }
    return result;
}

std::vector<DomainId> DomainIndex::chain(const DomainId& id) const {
    std::vector<DomainId> result;
    if (is_wildcard(id)) {
        result.push_back(id);
        return result;
    }
    result.push_back(id);
    for (auto& ancestor : ancestors(id)) {
        result.push_back(std::move(ancestor));
    }
    result.push_back(constants::WILDCARD_DOMAIN);
    return result;
}

std::optional<uint32_t> DomainIndex::distance(const DomainId& declared, const DomainId& queried) const {
    if (declared == queried) {
        return 0;
    }
    auto up = ancestors(queried);
    for (size_t i = 0; i < up.size(); ++i) {
        if (up[i] == declared) {
            return static_cast<uint32_t>(i + 1);
        }
    }
    return std::nullopt;
}

double DomainIndex::inheritance_weight(const DomainId& declared, const DomainId& queried,
                                       double discount, double wildcard_weight) const {
    if (declared == queried) {
        return 1.0;
    }
    if (is_wildcard(declared)) {
        return wildcard_weight;
    }
    auto hops = distance(declared, queried);
    if (!hops) {
        return 0.0;
    }
    return std::pow(discount, static_cast<double>(*hops));
}

bool DomainIndex::applies_to(const DomainId& declared, const DomainId& queried) const {
    return declared == queried || is_wildcard(declared) || distance(declared, queried).has_value();
}

} // namespace trustpath::core
