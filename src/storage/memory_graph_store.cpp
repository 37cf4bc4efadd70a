#include "storage/memory_graph_store.hpp"
#include "core/model/record_json.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <fstream>

namespace trustpath::storage {

using core::GraphChange;

/**
 * Read-only view over one immutable state
 */
class MemoryGraphStore::Snapshot : public core::GraphSnapshot {
public:
    Snapshot(std::shared_ptr<const Data> data, std::shared_ptr<std::atomic<bool>> available)
        : data_(std::move(data))
        , available_(std::move(available))
    {}

    std::vector<core::TrustEdge> outgoing_trust_edges(const PrincipalId& principal,
                                                      const DomainId& domain) const override {
        check_available();
        std::vector<core::TrustEdge> result;
        auto it = data_->outgoing.find(principal);
        if (it == data_->outgoing.end()) {
            return result;
        }
        for (const auto& edge : it->second) {
            if (data_->domains->applies_to(edge.domain, domain)) {
                result.push_back(edge);
            }
        }
        return result;
    }

    std::vector<core::Endorsement> incoming_endorsements(const SubjectId& subject,
                                                         const DomainId& domain) const override {
        check_available();
        std::vector<core::Endorsement> result;
        auto it = data_->incoming.find(subject);
        if (it == data_->incoming.end()) {
            return result;
        }
        for (const auto& endorsement : it->second) {
            if (data_->domains->applies_to(endorsement.domain, domain)) {
                result.push_back(endorsement);
            }
        }
        return result;
    }

    std::vector<core::DistrustEdge> distrust_edges(const PrincipalId& viewer,
                                                   const DomainId& domain) const override {
        check_available();
        std::vector<core::DistrustEdge> result;
        auto it = data_->distrust.find(viewer);
        if (it == data_->distrust.end()) {
            return result;
        }
        for (const auto& edge : it->second) {
            if (data_->domains->applies_to(edge.domain, domain)) {
                result.push_back(edge);
            }
        }
        return result;
    }

    std::optional<core::RegisteredKey> public_key_of(const PrincipalId& principal) const override {
        check_available();
        auto it = data_->principals.find(principal);
        if (it == data_->principals.end()) {
            return std::nullopt;
        }
        return it->second.public_key;
    }

    std::optional<core::PrincipalInfo> principal_info(const PrincipalId& principal) const override {
        check_available();
        auto it = data_->principals.find(principal);
        if (it == data_->principals.end()) {
            return std::nullopt;
        }
        return core::PrincipalInfo{it->second.id, it->second.type, it->second.created_at};
    }

    bool is_subject(const std::string& id) const override {
        check_available();
        return data_->subjects.count(id) > 0;
    }

    std::shared_ptr<const core::DomainIndex> domains() const override {
        check_available();
        return data_->domains;
    }

private:
    void check_available() const {
        if (!available_->load()) {
            throw StorageException(ErrorCode::PortUnavailable, "memory graph store is offline");
        }
    }

    std::shared_ptr<const Data> data_;
    std::shared_ptr<std::atomic<bool>> available_;
};

MemoryGraphStore::MemoryGraphStore()
    : available_(std::make_shared<std::atomic<bool>>(true))
{
    auto data = std::make_shared<Data>();
    data->domains = std::make_shared<const core::DomainIndex>();
    data_ = std::move(data);
}

MemoryGraphStore::~MemoryGraphStore() = default;

std::shared_ptr<const core::GraphSnapshot> MemoryGraphStore::open_snapshot() const {
    if (!available_->load()) {
        throw StorageException(ErrorCode::PortUnavailable, "memory graph store is offline");
    }
    return std::make_shared<Snapshot>(current(), available_);
}

core::SubscriptionId MemoryGraphStore::subscribe(core::ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    core::SubscriptionId id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void MemoryGraphStore::unsubscribe(core::SubscriptionId id) {
    // Waits for an in-progress publish, so the listener is not called afterwards
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(id);
}

void MemoryGraphStore::publish(const GraphChange& change) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (const auto& [id, listener] : listeners_) {
        listener(change);
    }
}

std::shared_ptr<const MemoryGraphStore::Data> MemoryGraphStore::current() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return data_;
}

template<typename F>
Result<void> MemoryGraphStore::mutate(F&& mutation) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    auto next = std::make_shared<Data>(*data_);
    auto result = mutation(*next);
    if (result.is_ok()) {
        data_ = std::move(next);
    }
    return result;
}

Result<void> MemoryGraphStore::apply_domain(Data& data, const core::Domain& domain) {
    auto index = std::make_shared<core::DomainIndex>(*data.domains);
    TRUSTPATH_TRY(index->add(domain));
    data.domains = std::move(index);
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::apply_trust_edge(Data& data, const core::TrustEdge& edge) {
    if (edge.from.empty() || edge.to.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Trust edge endpoints are required");
    }
    if (!data.domains->contains(edge.domain)) {
        return Result<void>::Err(ErrorCode::UnknownDomain, "Unknown domain '" + edge.domain + "'");
    }
    data.outgoing[edge.from].push_back(edge);
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::apply_endorsement(Data& data, const core::Endorsement& endorsement) {
    if (endorsement.from.empty() || endorsement.to.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Endorsement endpoints are required");
    }
    if (!data.domains->contains(endorsement.domain)) {
        return Result<void>::Err(ErrorCode::UnknownDomain,
                                 "Unknown domain '" + endorsement.domain + "'");
    }
    data.incoming[endorsement.to].push_back(endorsement);
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::apply_distrust_edge(Data& data, const core::DistrustEdge& edge) {
    if (edge.from.empty() || edge.to.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Distrust edge endpoints are required");
    }
    if (!data.domains->contains(edge.domain)) {
        return Result<void>::Err(ErrorCode::UnknownDomain, "Unknown domain '" + edge.domain + "'");
    }
    data.distrust[edge.from].push_back(edge);
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_domain(const core::Domain& domain) {
    TRUSTPATH_TRY(mutate([&](Data& data) { return apply_domain(data, domain); }));
    publish(GraphChange{GraphChange::Kind::Domain, domain.id, "", ""});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_principal(const core::Principal& principal) {
    if (principal.id.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Principal id is required");
    }
    TRUSTPATH_TRY(mutate([&](Data& data) {
        data.principals[principal.id] = principal;
        return Result<void>::Ok();
    }));
    publish(GraphChange{GraphChange::Kind::PrincipalKey, constants::WILDCARD_DOMAIN, principal.id, ""});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_subject(const core::Subject& subject) {
    if (subject.id.empty()) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Subject id is required");
    }
    TRUSTPATH_TRY(mutate([&](Data& data) {
        data.subjects[subject.id] = subject;
        return Result<void>::Ok();
    }));
    // A new subject can turn a principal-target query into a subject-target one
    publish(GraphChange{GraphChange::Kind::Endorsement, constants::WILDCARD_DOMAIN, "", subject.id});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_trust_edge(const core::TrustEdge& edge) {
    TRUSTPATH_TRY(mutate([&](Data& data) { return apply_trust_edge(data, edge); }));
    publish(GraphChange{GraphChange::Kind::TrustEdge, edge.domain, edge.from, edge.to});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_endorsement(const core::Endorsement& endorsement) {
    TRUSTPATH_TRY(mutate([&](Data& data) { return apply_endorsement(data, endorsement); }));
    publish(GraphChange{GraphChange::Kind::Endorsement, endorsement.domain,
                        endorsement.from, endorsement.to});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::add_distrust_edge(const core::DistrustEdge& edge) {
    TRUSTPATH_TRY(mutate([&](Data& data) { return apply_distrust_edge(data, edge); }));
    publish(GraphChange{GraphChange::Kind::Distrust, edge.domain, edge.from, edge.to});
    return Result<void>::Ok();
}

size_t MemoryGraphStore::remove_trust_edges(const PrincipalId& from, const PrincipalId& to,
                                            const DomainId& domain) {
    size_t removed = 0;
    auto result = mutate([&](Data& data) {
        auto it = data.outgoing.find(from);
        if (it != data.outgoing.end()) {
            auto& edges = it->second;
            auto before = edges.size();
            edges.erase(std::remove_if(edges.begin(), edges.end(), [&](const core::TrustEdge& e) {
                return e.to == to && e.domain == domain;
            }), edges.end());
            removed = before - edges.size();
        }
        return Result<void>::Ok();
    });
    if (result.is_ok() && removed > 0) {
        publish(GraphChange{GraphChange::Kind::TrustEdge, domain, from, to});
    }
    return removed;
}

size_t MemoryGraphStore::remove_endorsements(const PrincipalId& from, const SubjectId& to,
                                             const DomainId& domain) {
    size_t removed = 0;
    auto result = mutate([&](Data& data) {
        auto it = data.incoming.find(to);
        if (it != data.incoming.end()) {
            auto& endorsements = it->second;
            auto before = endorsements.size();
            endorsements.erase(std::remove_if(endorsements.begin(), endorsements.end(),
                [&](const core::Endorsement& e) {
                    return e.from == from && e.domain == domain;
                }), endorsements.end());
            removed = before - endorsements.size();
        }
        return Result<void>::Ok();
    });
    if (result.is_ok() && removed > 0) {
        publish(GraphChange{GraphChange::Kind::Endorsement, domain, from, to});
    }
    return removed;
}

bool MemoryGraphStore::remove_principal(const PrincipalId& id) {
    bool removed = false;
    auto result = mutate([&](Data& data) {
        removed = data.principals.erase(id) > 0;
        return Result<void>::Ok();
    });
    if (result.is_ok() && removed) {
        publish(GraphChange{GraphChange::Kind::PrincipalKey, constants::WILDCARD_DOMAIN, id, ""});
    }
    return removed;
}

void MemoryGraphStore::set_available(bool available) {
    available_->store(available);
    TRUSTPATH_LOG_INFO("Memory graph store is now {}", available ? "online" : "offline");
}

bool MemoryGraphStore::available() const {
    return available_->load();
}

Result<void> MemoryGraphStore::load_from_json(const json& document) {
    if (!document.is_object()) {
        return Result<void>::Err(ErrorCode::InvalidFormat, "Graph document must be a JSON object");
    }
    auto array_of = [&](const char* key) -> const json& {
        static const json empty = json::array();
        if (!document.contains(key)) {
            return empty;
        }
        return document.at(key);
    };
    for (const char* key : {"domains", "principals", "subjects", "trustEdges", "endorsements",
                            "distrustEdges"}) {
        if (!array_of(key).is_array()) {
            return Result<void>::Err(ErrorCode::InvalidFormat,
                                     std::string("'") + key + "' must be an array");
        }
    }

    Data data;
    data.domains = std::make_shared<const core::DomainIndex>();

    // Parents may be listed after their children; insert in dependency order
    std::vector<core::Domain> pending;
    for (const auto& item : array_of("domains")) {
        auto domain = core::domain_from_json(item);
        if (domain.is_err()) {
            return Result<void>::Err(domain.error());
        }
        pending.push_back(domain.value());
    }
    while (!pending.empty()) {
        std::vector<core::Domain> deferred;
        for (const auto& domain : pending) {
            bool parent_ready = !domain.parent || data.domains->contains(*domain.parent);
            if (parent_ready) {
                TRUSTPATH_TRY(apply_domain(data, domain));
            } else {
                deferred.push_back(domain);
            }
        }
        if (deferred.size() == pending.size()) {
            // No progress: report the first unresolved parent
            TRUSTPATH_TRY(apply_domain(data, deferred.front()));
        }
        pending = std::move(deferred);
    }

    for (const auto& item : array_of("principals")) {
        auto principal = core::principal_from_json(item);
        if (principal.is_err()) {
            return Result<void>::Err(principal.error());
        }
        data.principals[principal.value().id] = principal.value();
    }
    for (const auto& item : array_of("subjects")) {
        auto subject = core::subject_from_json(item);
        if (subject.is_err()) {
            return Result<void>::Err(subject.error());
        }
        data.subjects[subject.value().id] = subject.value();
    }
    for (const auto& item : array_of("trustEdges")) {
        auto edge = core::trust_edge_from_json(item);
        if (edge.is_err()) {
            return Result<void>::Err(edge.error());
        }
        TRUSTPATH_TRY(apply_trust_edge(data, edge.value()));
    }
    for (const auto& item : array_of("endorsements")) {
        auto endorsement = core::endorsement_from_json(item);
        if (endorsement.is_err()) {
            return Result<void>::Err(endorsement.error());
        }
        TRUSTPATH_TRY(apply_endorsement(data, endorsement.value()));
    }
    for (const auto& item : array_of("distrustEdges")) {
        auto edge = core::distrust_edge_from_json(item);
        if (edge.is_err()) {
            return Result<void>::Err(edge.error());
        }
        TRUSTPATH_TRY(apply_distrust_edge(data, edge.value()));
    }

    size_t edges = 0;
    for (const auto& [from, list] : data.outgoing) {
        edges += list.size();
    }
    size_t principals = data.principals.size();
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        data_ = std::make_shared<const Data>(std::move(data));
    }
    TRUSTPATH_LOG_INFO("Loaded graph: {} principals, {} trust edges", principals, edges);
    publish(GraphChange{GraphChange::Kind::Domain, constants::WILDCARD_DOMAIN, "", ""});
    return Result<void>::Ok();
}

Result<void> MemoryGraphStore::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<void>::Err(Error(ErrorCode::InvalidArgument,
                                       "Cannot open graph document", path));
    }
    json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return Result<void>::Err(Error(ErrorCode::InvalidFormat,
                                       "Graph document is not valid JSON", path));
    }
    return load_from_json(document);
}

std::vector<core::Principal> MemoryGraphStore::principals() const {
    auto data = current();
    std::vector<core::Principal> result;
    result.reserve(data->principals.size());
    for (const auto& [id, principal] : data->principals) {
        result.push_back(principal);
    }
    std::sort(result.begin(), result.end(), [](const core::Principal& a, const core::Principal& b) {
        return a.id < b.id;
    });
    return result;
}

size_t MemoryGraphStore::principal_count() const {
    return current()->principals.size();
}

size_t MemoryGraphStore::trust_edge_count() const {
    size_t count = 0;
    for (const auto& [from, edges] : current()->outgoing) {
        count += edges.size();
    }
    return count;
}

size_t MemoryGraphStore::endorsement_count() const {
    size_t count = 0;
    for (const auto& [to, endorsements] : current()->incoming) {
        count += endorsements.size();
    }
    return count;
}

size_t MemoryGraphStore::distrust_edge_count() const {
    size_t count = 0;
    for (const auto& [from, edges] : current()->distrust) {
        count += edges.size();
    }
    return count;
}

} // namespace trustpath::storage
