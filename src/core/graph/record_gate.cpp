#include "core/graph/record_gate.hpp"
#include "core/signing/canonical.hpp"
#include "core/signing/signature_verifier.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace trustpath::core {

namespace {
    bool well_formed(const TrustEdge& edge) { return edge.weight_in_range(); }
    bool well_formed(const Endorsement& endorsement) { return endorsement.weight_in_range(); }
    bool well_formed(const DistrustEdge& edge) { return !edge.to.empty() && edge.to != edge.from; }
}

const char* to_string(Admission admission) {
    switch (admission) {
        case Admission::Eligible: return "eligible";
        case Admission::InvalidSignature: return "invalid_signature";
        case Admission::UnknownSigner: return "unknown_signer";
        case Admission::Expired: return "expired";
        case Admission::Malformed: return "malformed";
        default: return "unknown";
    }
}

RecordGate::RecordGate(std::shared_ptr<const GraphSnapshot> snapshot, uint64_t now)
    : snapshot_(std::move(snapshot))
    , now_(now)
{}

Admission RecordGate::admit(const TrustEdge& edge) {
    return admit_record(edge, CanonicalEncoder::encode_trust_edge(edge));
}

Admission RecordGate::admit(const Endorsement& endorsement) {
    return admit_record(endorsement, CanonicalEncoder::encode_endorsement(endorsement));
}

Admission RecordGate::admit(const DistrustEdge& edge) {
    return admit_record(edge, CanonicalEncoder::encode_distrust(edge));
}

template<typename Record>
Admission RecordGate::admit_record(const Record& record, const std::optional<bytes>& canonical) {
    if (!canonical) {
        count(Admission::Malformed);
        TRUSTPATH_LOG_DEBUG("Excluded record from {}: no canonical encoding", short_id(record.from));
        return Admission::Malformed;
    }

    bytes algorithm_tag{static_cast<byte>(record.signature.algorithm)};
    Hash256 fingerprint = crypto::Blake3::hash_parts(
        {&*canonical, &record.signature.signature, &record.signature.public_key, &algorithm_tag});

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memo_.find(fingerprint);
        if (it != memo_.end()) {
            return it->second;
        }
    }

    Admission result = Admission::Eligible;
    if (!well_formed(record)) {
        result = Admission::Malformed;
    } else if (!record.is_live(now_)) {
        result = Admission::Expired;
    } else {
        auto key = key_of(record.from);
        if (!key) {
            result = Admission::UnknownSigner;
        } else {
            VerifyStatus status = SignatureVerifier::verify(*canonical, record.signature, *key);
            if (status != VerifyStatus::Valid) {
                result = Admission::InvalidSignature;
                TRUSTPATH_LOG_DEBUG("Signature check failed for record from {}: {}",
                                    short_id(record.from), to_string(status));
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Another worker may have raced us to the same record
    auto [it, inserted] = memo_.emplace(fingerprint, result);
    if (inserted) {
        ++stats_.records_considered;
        switch (result) {
            case Admission::InvalidSignature: ++stats_.invalid_signature; break;
            case Admission::UnknownSigner: ++stats_.unknown_signer; break;
            case Admission::Expired: ++stats_.expired; break;
            case Admission::Malformed: ++stats_.malformed; break;
            default: break;
        }
        if (result == Admission::Eligible && record.expires_at) {
            narrow_horizon(*record.expires_at);
        } else if (result == Admission::Expired && record.issued_at > now_) {
            narrow_horizon(record.issued_at);
        }
        if (result != Admission::Eligible) {
            TRUSTPATH_LOG_DEBUG("Excluded record {} -> {} ({}): {}",
                                short_id(record.from), short_id(record.to),
                                record.domain, to_string(result));
        }
    }
    return it->second;
}

std::optional<RegisteredKey> RecordGate::key_of(const PrincipalId& principal) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = keys_.find(principal);
        if (it != keys_.end()) {
            return it->second;
        }
    }
    // Port call happens outside the lock; StorageException propagates
    auto key = snapshot_->public_key_of(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.emplace(principal, key);
    return key;
}

void RecordGate::count(Admission admission) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.records_considered;
    if (admission == Admission::Malformed) {
        ++stats_.malformed;
    }
}

// Caller holds mutex_
void RecordGate::narrow_horizon(uint64_t instant) {
    horizon_ = std::min(horizon_, instant);
}

uint64_t RecordGate::validity_horizon() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return horizon_;
}

GateStats RecordGate::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace trustpath::core
