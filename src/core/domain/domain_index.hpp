#pragma once

#include "core/model/records.hpp"
#include "trustpath/error.hpp"
#include <unordered_map>
#include <vector>

namespace trustpath::core {

/**
 * DomainIndex - Trust domain forest keyed by id
 *
 * Each domain has at most one parent. The reserved wildcard domain "*" is
 * the implicit root of every chain and is never stored. The forest is kept
 * acyclic at insertion time; traversals assume it.
 */
class DomainIndex {
public:
    DomainIndex() = default;

    /**
     * Insert or re-parent a domain
     * @return InvalidArgument for an empty or reserved id, UnknownDomain for a
     *         missing parent, CyclicDomainHierarchy if the parent chain would
     *         loop back to the domain
     */
    Result<void> add(const Domain& domain);

    // Insert in order; stops at the first failure
    Result<void> add_all(const std::vector<Domain>& domains);

    bool remove(const DomainId& id);

    bool contains(const DomainId& id) const;
    std::optional<Domain> get(const DomainId& id) const;
    size_t size() const { return domains_.size(); }
    std::vector<Domain> all() const;

    /**
     * Ancestors of a domain, nearest first, excluding the domain itself and
     * the wildcard root
     */
    std::vector<DomainId> ancestors(const DomainId& id) const;

    /**
     * Domain chain used for cache scoping: the domain, its ancestors, then "*"
     */
    std::vector<DomainId> chain(const DomainId& id) const;

    // Hops from queried up to declared, or nullopt if declared is not an ancestor
    std::optional<uint32_t> distance(const DomainId& declared, const DomainId& queried) const;

    /**
     * Weight factor for an edge declared in `declared` when queried in
     * `queried`: 1 for an exact match, discount^n for an ancestor n levels up,
     * wildcard_weight for "*", 0 when unrelated
     */
    double inheritance_weight(const DomainId& declared, const DomainId& queried,
                              double discount, double wildcard_weight = 1.0) const;

    // True when edges declared in `declared` are visible from `queried`
    bool applies_to(const DomainId& declared, const DomainId& queried) const;

    static bool is_wildcard(const DomainId& id) { return id == constants::WILDCARD_DOMAIN; }

private:
    std::unordered_map<DomainId, Domain> domains_;
};

} // namespace trustpath::core
