#include "core/trust/path_enumerator.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <future>

namespace trustpath::core {

const char* to_string(TruncationReason reason) {
    switch (reason) {
        case TruncationReason::None: return "none";
        case TruncationReason::NodeBudget: return "node_budget";
        case TruncationReason::PathBudget: return "path_budget";
        case TruncationReason::Deadline: return "deadline";
        case TruncationReason::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const std::set<PrincipalId>& GraphObservation::upstream_of(const PrincipalId& principal) const {
    static const std::set<PrincipalId> none;
    auto it = incoming.find(principal);
    return it != incoming.end() ? it->second : none;
}

void GraphObservation::record(const PrincipalId& from, const PrincipalId& to, uint64_t issued_at) {
    auto& latest = outgoing[from][to];
    latest = std::max(latest, issued_at);
    incoming[to].insert(from);
}

PathEnumerator::PathEnumerator(std::shared_ptr<const GraphSnapshot> snapshot,
                               RecordGate& gate,
                               const EngineConfig& config,
                               const CancellationToken* cancel)
    : snapshot_(std::move(snapshot))
    , gate_(gate)
    , config_(config)
    , cancel_(cancel)
    , aggregator_(config.decay_factor)
{}

EnumerationResult PathEnumerator::enumerate(const EnumerationRequest& request) {
    request_ = request;
    deadline_ = std::make_unique<time::Deadline>(config_.query_timeout_ms);
    domains_ = snapshot_->domains();
    if (!domains_) {
        domains_ = std::make_shared<const DomainIndex>();
    }

    load_distrust();
    if (request_.target_kind == TargetKind::Subject) {
        load_endorsements();
    }

    Walk root;
    root.principals.push_back(request_.source);
    root.on_path.insert(request_.source);

    NeighbourList first_hops = step(root);
    if (first_hops) {
        run_branches(root, *first_hops);
    }

    EnumerationResult result;
    result.paths = std::move(root.found);
    aggregator_.rank(result.paths);

    result.stats.nodes_visited = std::min<uint64_t>(nodes_visited_.load(), config_.max_nodes_visited);
    result.stats.fanout_pruned = fanout_pruned_.load();
    result.stats.domain_mismatch = domain_mismatch_.load();
    result.stats.confidence_pruned = confidence_pruned_.load();
    result.stats.distrust_excluded = distrust_excluded_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.stats.truncation_reason = truncation_reason_;
        result.stats.truncated = truncation_reason_ != TruncationReason::None;
        result.observed = observed_;
    }

    if (result.stats.truncated) {
        TRUSTPATH_LOG_WARN("Enumeration {} -> {} in '{}' truncated ({}) after {} nodes, {} paths",
                           short_id(request_.source), short_id(request_.target), request_.domain,
                           to_string(result.stats.truncation_reason),
                           result.stats.nodes_visited, result.paths.size());
    } else {
        TRUSTPATH_LOG_DEBUG("Enumeration {} -> {} in '{}': {} nodes, {} paths",
                            short_id(request_.source), short_id(request_.target), request_.domain,
                            result.stats.nodes_visited, result.paths.size());
    }
    return result;
}

void PathEnumerator::visit(Walk& walk) {
    NeighbourList neighbours = step(walk);
    if (!neighbours) {
        return;
    }
    for (const auto& next : *neighbours) {
        if (should_stop()) {
            break;
        }
        descend(walk, next);
    }
}

PathEnumerator::NeighbourList PathEnumerator::step(Walk& walk) {
    if (should_stop()) {
        return nullptr;
    }
    if (nodes_visited_.fetch_add(1) + 1 > config_.max_nodes_visited) {
        truncate(TruncationReason::NodeBudget);
        return nullptr;
    }

    const PrincipalId& current = walk.principals.back();
    if (request_.target_kind == TargetKind::Subject) {
        auto it = endorsers_.find(current);
        if (it != endorsers_.end()) {
            if (walk.hops.size() + 1 <= request_.max_depth) {
                emit(walk, it->second);
            }
            return nullptr;
        }
    } else if (current == request_.target && !walk.hops.empty()) {
        emit(walk, std::nullopt);
        return nullptr;
    }

    if (!has_room_for_hop(walk)) {
        return nullptr;
    }
    return expand(current);
}

void PathEnumerator::descend(Walk& walk, const PathHop& next) {
    if (walk.on_path.count(next.to) > 0) {
        return;
    }
    if (distrusted_.count(next.to) > 0) {
        distrust_excluded_.fetch_add(1);
        return;
    }

    double product = walk.product * next.effective_weight();
    double partial = product * aggregator_.decay(static_cast<uint32_t>(walk.hops.size() + 1));
    if (partial < config_.min_path_confidence) {
        confidence_pruned_.fetch_add(1);
        return;
    }

    double saved = walk.product;
    walk.principals.push_back(next.to);
    walk.on_path.insert(next.to);
    walk.hops.push_back(next);
    walk.product = product;

    visit(walk);

    walk.product = saved;
    walk.hops.pop_back();
    walk.on_path.erase(next.to);
    walk.principals.pop_back();
}

void PathEnumerator::run_branches(Walk& root, const std::vector<PathHop>& branches) {
    size_t workers = std::min<size_t>(config_.parallel_branches, branches.size());
    if (workers <= 1) {
        for (const auto& next : branches) {
            if (should_stop()) {
                break;
            }
            descend(root, next);
        }
        return;
    }

    // Each worker walks every workers-th first hop on its own path state
    std::vector<std::future<std::vector<CandidatePath>>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [this, &branches, w, workers]() {
            Walk walk;
            walk.principals.push_back(request_.source);
            walk.on_path.insert(request_.source);
            try {
                for (size_t i = w; i < branches.size(); i += workers) {
                    if (should_stop()) {
                        break;
                    }
                    descend(walk, branches[i]);
                }
            } catch (const std::exception&) {
                // Halt the siblings; the exception reaches the caller through get()
                stop_.store(true);
                throw;
            }
            return std::move(walk.found);
        }));
    }

    for (auto& future : futures) {
        auto found = future.get();
        root.found.insert(root.found.end(),
                          std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
}

PathEnumerator::NeighbourList PathEnumerator::expand(const PrincipalId& principal) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = expansions_.find(principal);
        if (it != expansions_.end()) {
            return it->second;
        }
    }

    Selection selection = select_records(
        snapshot_->outgoing_trust_edges(principal, request_.domain), true);

    auto list = std::make_shared<std::vector<PathHop>>();
    list->reserve(selection.best.size());
    for (auto& [to, hop] : selection.best) {
        list->push_back(std::move(hop));
    }
    std::sort(list->begin(), list->end(), [](const PathHop& a, const PathHop& b) {
        if (a.effective_weight() != b.effective_weight()) {
            return a.effective_weight() > b.effective_weight();
        }
        return a.to < b.to;
    });

    uint64_t pruned = 0;
    if (list->size() > config_.max_branch_fanout) {
        pruned = list->size() - config_.max_branch_fanout;
        list->resize(config_.max_branch_fanout);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = expansions_.emplace(principal, std::move(list));
    if (inserted) {
        fanout_pruned_.fetch_add(pruned);
        domain_mismatch_.fetch_add(selection.domain_mismatch);
        observed_.outgoing[principal];
        for (const auto& [from, to, issued_at] : selection.admitted) {
            observed_.record(from, to, issued_at);
        }
    }
    return it->second;
}

void PathEnumerator::load_endorsements() {
    Selection selection = select_records(
        snapshot_->incoming_endorsements(request_.target, request_.domain), false);
    endorsers_ = std::move(selection.best);
    domain_mismatch_.fetch_add(selection.domain_mismatch);
}

void PathEnumerator::load_distrust() {
    for (const auto& edge : snapshot_->distrust_edges(request_.source, request_.domain)) {
        if (edge.from != request_.source) {
            continue;
        }
        if (!domains_->applies_to(edge.domain, request_.domain)) {
            domain_mismatch_.fetch_add(1);
            continue;
        }
        if (gate_.admit(edge) == Admission::Eligible) {
            distrusted_.insert(edge.to);
        }
    }
    if (!distrusted_.empty()) {
        TRUSTPATH_LOG_DEBUG("{} distrusts {} principals in '{}'",
                            short_id(request_.source), distrusted_.size(), request_.domain);
    }
}

template<typename Record>
PathEnumerator::Selection PathEnumerator::select_records(const std::vector<Record>& records,
                                                         bool outgoing) {
    Selection selection;

    // (key, declared domain) -> latest admitted record
    std::map<std::pair<std::string, DomainId>, const Record*> latest;
    for (const auto& record : records) {
        const std::string& key = outgoing ? record.to : record.from;
        if (key.empty() || (outgoing && record.to == record.from)) {
            continue;
        }
        if (outgoing && record.from.empty()) {
            continue;
        }
        double factor = domains_->inheritance_weight(record.domain, request_.domain,
                                                     config_.domain_inheritance_discount,
                                                     config_.wildcard_domain_weight);
        if (factor <= 0.0) {
            ++selection.domain_mismatch;
            continue;
        }
        if (gate_.admit(record) != Admission::Eligible) {
            continue;
        }
        if (outgoing) {
            selection.admitted.emplace_back(record.from, record.to, record.issued_at);
        }

        auto slot = std::make_pair(key, record.domain);
        auto it = latest.find(slot);
        if (it == latest.end()) {
            latest.emplace(slot, &record);
        } else if (record.issued_at > it->second->issued_at ||
                   (record.issued_at == it->second->issued_at && record.weight > it->second->weight)) {
            it->second = &record;
        }
    }

    for (const auto& [slot, record] : latest) {
        PathHop hop;
        hop.from = record->from;
        hop.to = record->to;
        hop.domain = record->domain;
        hop.weight = record->weight;
        hop.domain_factor = domains_->inheritance_weight(record->domain, request_.domain,
                                                         config_.domain_inheritance_discount,
                                                         config_.wildcard_domain_weight);
        // Iteration is ordered by domain id, so equal weights keep the first domain
        auto it = selection.best.find(slot.first);
        if (it == selection.best.end() || hop.effective_weight() > it->second.effective_weight()) {
            selection.best[slot.first] = std::move(hop);
        }
    }
    return selection;
}

bool PathEnumerator::should_stop() {
    if (stop_.load()) {
        return true;
    }
    if (cancel_ && cancel_->is_cancelled()) {
        truncate(TruncationReason::Cancelled);
        return true;
    }
    if (deadline_ && deadline_->expired()) {
        truncate(TruncationReason::Deadline);
        return true;
    }
    return false;
}

void PathEnumerator::truncate(TruncationReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (truncation_reason_ == TruncationReason::None) {
        truncation_reason_ = reason;
    }
    stop_.store(true);
}

bool PathEnumerator::has_room_for_hop(const Walk& walk) const {
    // Subject targets reserve one hop for the terminal endorsement
    size_t reserved = request_.target_kind == TargetKind::Subject ? 2 : 1;
    return walk.hops.size() + reserved <= request_.max_depth;
}

void PathEnumerator::emit(Walk& walk, const std::optional<PathHop>& endorsement) {
    CandidatePath path;
    path.principals = walk.principals;
    path.hops = walk.hops;
    path.endorsement = endorsement;
    path.raw_confidence = aggregator_.raw_confidence(path);
    if (path.raw_confidence < config_.min_path_confidence) {
        confidence_pruned_.fetch_add(1);
        return;
    }
    if (paths_found_.fetch_add(1) + 1 > config_.max_paths) {
        truncate(TruncationReason::PathBudget);
        return;
    }
    walk.found.push_back(std::move(path));
}

} // namespace trustpath::core
