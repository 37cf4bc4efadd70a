#pragma once

#include "core/graph/graph_port.hpp"
#include <limits>
#include <mutex>
#include <unordered_map>

namespace trustpath::core {

enum class Admission {
    Eligible,
    InvalidSignature,
    UnknownSigner,
    Expired,        // outside issuedAt <= now < expiresAt
    Malformed       // weight out of range or no canonical encoding
};

const char* to_string(Admission admission);

struct GateStats {
    uint64_t records_considered = 0;
    uint64_t invalid_signature = 0;
    uint64_t unknown_signer = 0;
    uint64_t expired = 0;
    uint64_t malformed = 0;
};

/**
 * RecordGate - Decides which records are trust-eligible during one query
 *
 * Verification outcomes are memoised by a BLAKE3 fingerprint of the record's
 * canonical bytes and signature, so a record reached along several branches
 * is verified and counted once. Safe for concurrent use by enumeration
 * workers sharing the same snapshot.
 */
class RecordGate {
public:
    RecordGate(std::shared_ptr<const GraphSnapshot> snapshot, uint64_t now);

    Admission admit(const TrustEdge& edge);
    Admission admit(const Endorsement& endorsement);
    Admission admit(const DistrustEdge& edge);

    GateStats stats() const;
    uint64_t now() const { return now_; }

    /**
     * Earliest instant at which an admission decision made so far would
     * change: the soonest expiresAt of an admitted record, or the soonest
     * issuedAt of a record rejected as not yet live. UINT64_MAX when no
     * decision depends on time.
     */
    uint64_t validity_horizon() const;

private:
    template<typename Record>
    Admission admit_record(const Record& record, const std::optional<bytes>& canonical);

    std::optional<RegisteredKey> key_of(const PrincipalId& principal);
    void count(Admission admission);
    void narrow_horizon(uint64_t instant);

    std::shared_ptr<const GraphSnapshot> snapshot_;
    uint64_t now_;

    mutable std::mutex mutex_;
    std::unordered_map<Hash256, Admission> memo_;
    std::unordered_map<PrincipalId, std::optional<RegisteredKey>> keys_;
    GateStats stats_;
    uint64_t horizon_ = std::numeric_limits<uint64_t>::max();
};

} // namespace trustpath::core
