#include "core/model/records.hpp"

namespace trustpath::core {

namespace {
    bool within_validity(uint64_t issued_at, const std::optional<uint64_t>& expires_at, uint64_t now) {
        if (issued_at > now) {
            return false;
        }
        return !expires_at || now < *expires_at;
    }
}

bool TrustEdge::is_live(uint64_t now) const {
    return within_validity(issued_at, expires_at, now);
}

bool Endorsement::is_live(uint64_t now) const {
    return within_validity(issued_at, expires_at, now);
}

bool DistrustEdge::is_live(uint64_t now) const {
    return within_validity(issued_at, expires_at, now);
}

const char* to_string(PrincipalType type) {
    switch (type) {
        case PrincipalType::USER: return "user";
        case PrincipalType::ORGANIZATION: return "organization";
        case PrincipalType::AGENT: return "agent";
    }
    return "user";
}

const char* to_string(SubjectType type) {
    switch (type) {
        case SubjectType::BUSINESS: return "business";
        case SubjectType::INDIVIDUAL: return "individual";
        case SubjectType::PRODUCT: return "product";
        case SubjectType::SERVICE: return "service";
    }
    return "business";
}

const char* to_string(SignatureAlgorithm algorithm) {
    switch (algorithm) {
        case SignatureAlgorithm::ED25519: return "ed25519";
        case SignatureAlgorithm::SECP256K1: return "secp256k1";
    }
    return "ed25519";
}

const char* to_string(DistrustReason reason) {
    switch (reason) {
        case DistrustReason::SPAM: return "spam";
        case DistrustReason::MALICIOUS: return "malicious";
        case DistrustReason::INCOMPETENT: return "incompetent";
        case DistrustReason::CONFLICT_OF_INTEREST: return "conflict_of_interest";
        case DistrustReason::OTHER: return "other";
    }
    return "other";
}

std::optional<PrincipalType> parse_principal_type(const std::string& str) {
    if (str == "user") return PrincipalType::USER;
    if (str == "organization") return PrincipalType::ORGANIZATION;
    if (str == "agent") return PrincipalType::AGENT;
    return std::nullopt;
}

std::optional<SubjectType> parse_subject_type(const std::string& str) {
    if (str == "business") return SubjectType::BUSINESS;
    if (str == "individual") return SubjectType::INDIVIDUAL;
    if (str == "product") return SubjectType::PRODUCT;
    if (str == "service") return SubjectType::SERVICE;
    return std::nullopt;
}

std::optional<SignatureAlgorithm> parse_signature_algorithm(const std::string& str) {
    if (str == "ed25519") return SignatureAlgorithm::ED25519;
    if (str == "secp256k1") return SignatureAlgorithm::SECP256K1;
    return std::nullopt;
}

std::optional<DistrustReason> parse_distrust_reason(const std::string& str) {
    if (str == "spam") return DistrustReason::SPAM;
    if (str == "malicious") return DistrustReason::MALICIOUS;
    if (str == "incompetent") return DistrustReason::INCOMPETENT;
    if (str == "conflict_of_interest") return DistrustReason::CONFLICT_OF_INTEREST;
    if (str == "other") return DistrustReason::OTHER;
    return std::nullopt;
}

} // namespace trustpath::core
