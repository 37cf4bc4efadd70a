#pragma once

#include "trustpath/common.hpp"
#include <map>
#include <set>
#include <optional>
#include <string>

namespace trustpath::core {

enum class PrincipalType {
    USER,
    ORGANIZATION,
    AGENT
};

enum class SubjectType {
    BUSINESS,
    INDIVIDUAL,
    PRODUCT,
    SERVICE
};

/**
 * Closed set of signature algorithms accepted on trust records
 */
enum class SignatureAlgorithm {
    ED25519,
    SECP256K1
};

enum class DistrustReason {
    SPAM,
    MALICIOUS,
    INCOMPETENT,
    CONFLICT_OF_INTEREST,
    OTHER
};

const char* to_string(PrincipalType type);
const char* to_string(SubjectType type);
const char* to_string(SignatureAlgorithm algorithm);
const char* to_string(DistrustReason reason);

std::optional<PrincipalType> parse_principal_type(const std::string& str);
std::optional<SubjectType> parse_subject_type(const std::string& str);
std::optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& str);
std::optional<DistrustReason> parse_distrust_reason(const std::string& str);

/**
 * RegisteredKey - The public key bound to a principal by the storage layer
 */
struct RegisteredKey {
    SignatureAlgorithm algorithm;
    bytes key;

    bool operator==(const RegisteredKey& other) const {
        return algorithm == other.algorithm && key == other.key;
    }
};

/**
 * Principal - Identity anchor for signature verification
 */
struct Principal {
    PrincipalId id;
    PrincipalType type = PrincipalType::USER;
    RegisteredKey public_key;
    uint64_t created_at = 0;
    std::map<std::string, std::string> metadata;
};

struct GeoLocation {
    double latitude;
    double longitude;
};

/**
 * Subject - Endorsement target; never a signer
 */
struct Subject {
    SubjectId id;
    SubjectType type = SubjectType::BUSINESS;
    std::set<DomainId> domains;
    std::optional<GeoLocation> location;
    std::map<std::string, std::string> external_ids;
};

/**
 * Domain - Named trust scope; forms a forest through parent links
 */
struct Domain {
    DomainId id;
    std::optional<DomainId> parent;
    std::string name;
};

/**
 * RecordSignature - Binds the signer's declared key to the canonical payload
 */
struct RecordSignature {
    SignatureAlgorithm algorithm = SignatureAlgorithm::ED25519;
    bytes public_key;
    bytes signature;
    uint64_t signed_at = 0;
};

/**
 * TrustEdge - "from" delegates trust to "to" within a domain
 */
struct TrustEdge {
    PrincipalId from;
    PrincipalId to;
    DomainId domain;
    double weight = 0.0;           // 0.0 to 1.0
    RecordSignature signature;
    uint64_t issued_at = 0;
    std::optional<uint64_t> expires_at;

    bool weight_in_range() const { return weight >= 0.0 && weight <= 1.0; }
    bool is_live(uint64_t now) const;
};

/**
 * Endorsement - Signed statement from a principal about a subject.
 * Ratings are normalized into weight by the producer.
 */
struct Endorsement {
    PrincipalId from;
    SubjectId to;
    DomainId domain;
    double weight = 0.0;           // 0.0 to 1.0
    RecordSignature signature;
    uint64_t issued_at = 0;
    std::optional<uint64_t> expires_at;

    bool weight_in_range() const { return weight >= 0.0 && weight <= 1.0; }
    bool is_live(uint64_t now) const;
};

/**
 * DistrustEdge - "from" refuses to route trust through "to" within a domain.
 * Carries no weight; a "*" domain applies everywhere.
 */
struct DistrustEdge {
    PrincipalId from;
    PrincipalId to;
    DomainId domain;
    DistrustReason reason = DistrustReason::OTHER;
    RecordSignature signature;
    uint64_t issued_at = 0;
    std::optional<uint64_t> expires_at;

    bool is_live(uint64_t now) const;
};

} // namespace trustpath::core
