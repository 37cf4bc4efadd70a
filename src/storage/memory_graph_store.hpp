#pragma once

#include "core/graph/graph_port.hpp"
#include "trustpath/error.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace trustpath::storage {

using json = nlohmann::json;

/**
 * In-process Graph Access Port
 *
 * Every mutation builds a new immutable copy of the graph, so a snapshot
 * keeps reading the state it was opened on for as long as it is held.
 * Mutations publish a GraphChange to subscribers after the new state is
 * visible. Records are stored as given; admission is the engine's job.
 */
class MemoryGraphStore : public core::GraphAccessPort {
public:
    MemoryGraphStore();
    ~MemoryGraphStore() override;

    // Disable copy and move
    MemoryGraphStore(const MemoryGraphStore&) = delete;
    MemoryGraphStore& operator=(const MemoryGraphStore&) = delete;

    // GraphAccessPort
    std::shared_ptr<const core::GraphSnapshot> open_snapshot() const override;
    core::SubscriptionId subscribe(core::ChangeListener listener) override;
    void unsubscribe(core::SubscriptionId id) override;

    /**
     * Add or re-parent a domain. Rejects cycles and unknown parents.
     */
    Result<void> add_domain(const core::Domain& domain);

    /**
     * Register or re-key a principal
     */
    Result<void> add_principal(const core::Principal& principal);
    Result<void> add_subject(const core::Subject& subject);

    /**
     * Store a trust edge, endorsement or distrust edge in a known domain
     */
    Result<void> add_trust_edge(const core::TrustEdge& edge);
    Result<void> add_endorsement(const core::Endorsement& endorsement);
    Result<void> add_distrust_edge(const core::DistrustEdge& edge);

    // Remove every record between the pair in the domain; returns how many went
    size_t remove_trust_edges(const PrincipalId& from, const PrincipalId& to, const DomainId& domain);
    size_t remove_endorsements(const PrincipalId& from, const SubjectId& to, const DomainId& domain);
    bool remove_principal(const PrincipalId& id);

    /**
     * Simulate a backend outage. While unavailable, opening a snapshot and
     * reading from any open snapshot throw StorageException(PortUnavailable).
     */
    void set_available(bool available);
    bool available() const;

    /**
     * Replace the whole graph from a document with optional arrays
     * "domains", "principals", "subjects", "trustEdges", "endorsements",
     * "distrustEdges".
     * Either the whole document loads or the store is left untouched.
     */
    Result<void> load_from_json(const json& document);
    Result<void> load_from_file(const std::string& path);

    std::vector<core::Principal> principals() const;
    size_t principal_count() const;
    size_t trust_edge_count() const;
    size_t endorsement_count() const;
    size_t distrust_edge_count() const;

private:
    struct Data {
        std::shared_ptr<const core::DomainIndex> domains;
        std::unordered_map<PrincipalId, core::Principal> principals;
        std::unordered_map<SubjectId, core::Subject> subjects;
        std::unordered_map<PrincipalId, std::vector<core::TrustEdge>> outgoing;
        std::unordered_map<SubjectId, std::vector<core::Endorsement>> incoming;
        std::unordered_map<PrincipalId, std::vector<core::DistrustEdge>> distrust;
    };

    class Snapshot;

    std::shared_ptr<const Data> current() const;

    // Copy the current state, apply the mutation and publish it if it succeeds
    template<typename F>
    Result<void> mutate(F&& mutation);

    static Result<void> apply_domain(Data& data, const core::Domain& domain);
    static Result<void> apply_trust_edge(Data& data, const core::TrustEdge& edge);
    static Result<void> apply_endorsement(Data& data, const core::Endorsement& endorsement);
    static Result<void> apply_distrust_edge(Data& data, const core::DistrustEdge& edge);

    void publish(const core::GraphChange& change);

    mutable std::mutex data_mutex_;
    std::shared_ptr<const Data> data_;
    std::shared_ptr<std::atomic<bool>> available_;

    std::mutex listener_mutex_;
    std::map<core::SubscriptionId, core::ChangeListener> listeners_;
    core::SubscriptionId next_subscription_ = 1;
};

} // namespace trustpath::storage
