#pragma once

#include "core/model/records.hpp"
#include "core/domain/domain_index.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace trustpath::core {

/**
 * PrincipalInfo - Graph-position facts used for sybil signals
 */
struct PrincipalInfo {
    PrincipalId id;
    PrincipalType type = PrincipalType::USER;
    uint64_t created_at = 0;
};

/**
 * GraphChange - Mutation notice published by the storage layer
 */
struct GraphChange {
    enum class Kind {
        TrustEdge,
        Endorsement,
        Distrust,
        PrincipalKey,
        Domain
    };

    Kind kind;
    DomainId domain;
    std::string from;
    std::string to;
};

using ChangeListener = std::function<void(const GraphChange&)>;
using SubscriptionId = uint64_t;

/**
 * GraphSnapshot - Repeatable-read view of the trust graph for one query
 *
 * All methods are const and safe to call from several threads at once.
 * Edge lookups return every live-or-not record whose declared domain is the
 * queried domain, one of its ancestors, or "*". Admission (signature,
 * validity window, weight) is the caller's job.
 * Implementations throw StorageException(PortUnavailable) on backend failure.
 */
class GraphSnapshot {
public:
    virtual ~GraphSnapshot() = default;

    virtual std::vector<TrustEdge> outgoing_trust_edges(const PrincipalId& principal,
                                                        const DomainId& domain) const = 0;
    virtual std::vector<Endorsement> incoming_endorsements(const SubjectId& subject,
                                                           const DomainId& domain) const = 0;
    // Distrust declared by the viewer, with the same domain selection as edges
    virtual std::vector<DistrustEdge> distrust_edges(const PrincipalId& viewer,
                                                     const DomainId& domain) const = 0;
    virtual std::optional<RegisteredKey> public_key_of(const PrincipalId& principal) const = 0;
    virtual std::optional<PrincipalInfo> principal_info(const PrincipalId& principal) const = 0;
    virtual bool is_subject(const std::string& id) const = 0;
    virtual std::shared_ptr<const DomainIndex> domains() const = 0;
};

/**
 * GraphAccessPort - Read interface the engine consumes; never mutated by it
 */
class GraphAccessPort {
public:
    virtual ~GraphAccessPort() = default;

    virtual std::shared_ptr<const GraphSnapshot> open_snapshot() const = 0;

    virtual SubscriptionId subscribe(ChangeListener listener) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace trustpath::core
