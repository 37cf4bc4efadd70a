#pragma once

#include "core/graph/record_gate.hpp"
#include "core/trust/aggregation.hpp"
#include "core/trust/engine_config.hpp"
#include "core/trust/trust_path.hpp"
#include "trustpath/time_utils.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace trustpath::core {

/**
 * CancellationToken - Cooperative cancellation shared with a running query
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

enum class TruncationReason {
    None,
    NodeBudget,
    PathBudget,
    Deadline,
    Cancelled
};

const char* to_string(TruncationReason reason);

struct EnumerationStats {
    uint64_t nodes_visited = 0;
    uint64_t fanout_pruned = 0;
    uint64_t domain_mismatch = 0;
    uint64_t confidence_pruned = 0;
    uint64_t distrust_excluded = 0;
    bool truncated = false;
    TruncationReason truncation_reason = TruncationReason::None;
};

/**
 * Admitted trust edges seen while expanding the graph
 *
 * Only expanded principals have known outgoing edges. Inbound edges are
 * whatever admitted edges of expanded principals pointed at a node, so they
 * are a lower bound on the real in-neighbourhood.
 */
struct GraphObservation {
    // expanded principal -> recipient -> latest issuedAt among admitted edges
    std::map<PrincipalId, std::map<PrincipalId, uint64_t>> outgoing;
    // recipient -> issuers of admitted edges
    std::map<PrincipalId, std::set<PrincipalId>> incoming;

    bool expanded(const PrincipalId& principal) const { return outgoing.count(principal) > 0; }
    const std::set<PrincipalId>& upstream_of(const PrincipalId& principal) const;
    void record(const PrincipalId& from, const PrincipalId& to, uint64_t issued_at);
};

struct EnumerationRequest {
    PrincipalId source;
    std::string target;
    TargetKind target_kind = TargetKind::Principal;
    DomainId domain;
    uint32_t max_depth = constants::DEFAULT_MAX_DEPTH;
};

struct EnumerationResult {
    std::vector<CandidatePath> paths;   // ranked, see path_order
    EnumerationStats stats;
    GraphObservation observed;
};

/**
 * PathEnumerator - Bounded depth-first search over admitted trust edges
 *
 * Cycle avoidance is per path: a principal never appears twice on one path
 * but may appear on many. A branch ends at the target principal, or, for a
 * subject target, at the first principal holding an admitted endorsement of
 * the subject (the endorsement is the final hop). Branches whose running
 * confidence falls under min_path_confidence are pruned. Principals the
 * source has distrusted in the queried domain are never entered.
 *
 * First-hop branches run on up to parallel_branches workers. The node
 * budget, path budget, deadline and cancellation all stop every worker and
 * mark the result truncated.
 */
class PathEnumerator {
public:
    PathEnumerator(std::shared_ptr<const GraphSnapshot> snapshot,
                   RecordGate& gate,
                   const EngineConfig& config,
                   const CancellationToken* cancel = nullptr);

    /**
     * Throws StorageException if the snapshot fails mid-walk
     */
    EnumerationResult enumerate(const EnumerationRequest& request);

private:
    using NeighbourList = std::shared_ptr<const std::vector<PathHop>>;

    struct Selection {
        std::map<std::string, PathHop> best;
        std::vector<std::tuple<PrincipalId, PrincipalId, uint64_t>> admitted;
        uint64_t domain_mismatch = 0;
    };

    struct Walk {
        std::vector<PrincipalId> principals;
        std::unordered_set<PrincipalId> on_path;
        std::vector<PathHop> hops;
        double product = 1.0;
        std::vector<CandidatePath> found;
    };

    void visit(Walk& walk);
    NeighbourList step(Walk& walk);
    void descend(Walk& walk, const PathHop& next);
    void run_branches(Walk& root, const std::vector<PathHop>& branches);

    NeighbourList expand(const PrincipalId& principal);
    void load_endorsements();
    void load_distrust();

    bool should_stop();
    void truncate(TruncationReason reason);
    bool has_room_for_hop(const Walk& walk) const;
    void emit(Walk& walk, const std::optional<PathHop>& endorsement);

    // Latest issuedAt per declared domain, then best effective weight across domains.
    // Outgoing edges are keyed by recipient, endorsements by endorser.
    template<typename Record>
    Selection select_records(const std::vector<Record>& records, bool outgoing);

    std::shared_ptr<const GraphSnapshot> snapshot_;
    std::shared_ptr<const DomainIndex> domains_;
    RecordGate& gate_;
    const EngineConfig& config_;
    const CancellationToken* cancel_;
    Aggregator aggregator_;

    EnumerationRequest request_;
    std::unique_ptr<time::Deadline> deadline_;
    std::map<PrincipalId, PathHop> endorsers_;
    std::set<PrincipalId> distrusted_;

    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> nodes_visited_{0};
    std::atomic<uint64_t> paths_found_{0};
    std::atomic<uint64_t> fanout_pruned_{0};
    std::atomic<uint64_t> domain_mismatch_{0};
    std::atomic<uint64_t> confidence_pruned_{0};
    std::atomic<uint64_t> distrust_excluded_{0};

    std::mutex mutex_;
    TruncationReason truncation_reason_ = TruncationReason::None;
    std::unordered_map<PrincipalId, NeighbourList> expansions_;
    GraphObservation observed_;
};

} // namespace trustpath::core
