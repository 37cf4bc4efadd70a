#include "core/signing/canonical.hpp"
#include "trustpath/time_utils.hpp"
#include <cmath>
#include <limits>

namespace trustpath::core {

namespace {
    template<typename Record>
    json record_payload(const Record& record, const char* kind) {
        // nlohmann::json objects are std::map backed, so keys come out sorted
        json payload = json::object();
        payload["domain"] = record.domain;
        if (record.expires_at) {
            payload["expiresAt"] = time::timestamp_to_iso8601(*record.expires_at);
        }
        payload["from"] = record.from;
        payload["issuedAt"] = time::timestamp_to_iso8601(record.issued_at);
        payload["kind"] = kind;
        payload["to"] = record.to;
        return payload;
    }

    std::optional<bytes> to_bytes(const std::optional<std::string>& encoded) {
        if (!encoded) {
            return std::nullopt;
        }
        return bytes(encoded->begin(), encoded->end());
    }
}

json CanonicalEncoder::number(double value) {
    // 1.0 encodes as "1", matching producers that serialize numbers as JSON numbers
    if (std::isfinite(value) && std::floor(value) == value &&
        std::fabs(value) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return json(static_cast<int64_t>(value));
    }
    return json(value);
}

json CanonicalEncoder::trust_edge_payload(const TrustEdge& edge) {
    json payload = record_payload(edge, "trust");
    payload["weight"] = number(edge.weight);
    return payload;
}

json CanonicalEncoder::endorsement_payload(const Endorsement& endorsement) {
    json payload = record_payload(endorsement, "endorsement");
    payload["weight"] = number(endorsement.weight);
    return payload;
}

json CanonicalEncoder::distrust_payload(const DistrustEdge& edge) {
    json payload = record_payload(edge, "distrust");
    payload["reason"] = to_string(edge.reason);
    return payload;
}

std::optional<std::string> CanonicalEncoder::encode(const json& payload) {
    try {
        return payload.dump(-1, ' ', false, json::error_handler_t::strict);
    } catch (const json::type_error&) {
        return std::nullopt;
    }
}

std::optional<bytes> CanonicalEncoder::encode_trust_edge(const TrustEdge& edge) {
    return to_bytes(encode(trust_edge_payload(edge)));
}

std::optional<bytes> CanonicalEncoder::encode_endorsement(const Endorsement& endorsement) {
    return to_bytes(encode(endorsement_payload(endorsement)));
}

std::optional<bytes> CanonicalEncoder::encode_distrust(const DistrustEdge& edge) {
    return to_bytes(encode(distrust_payload(edge)));
}

} // namespace trustpath::core
