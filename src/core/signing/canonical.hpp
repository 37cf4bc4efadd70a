#pragma once

#include "core/model/records.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace trustpath::core {

using json = nlohmann::json;

/**
 * CanonicalEncoder - Deterministic byte encoding of signed record payloads
 *
 * Payloads are JSON objects with lexicographically sorted keys and no
 * insignificant whitespace. Timestamps are ISO 8601 UTC with millisecond
 * precision. Integral numbers carry no fractional part. The signature
 * itself is never part of the payload.
 *
 * Encoding fails (nullopt) for payloads that are not valid UTF-8, so such
 * records can never verify.
 */
class CanonicalEncoder {
public:
    static json trust_edge_payload(const TrustEdge& edge);
    static json endorsement_payload(const Endorsement& endorsement);
    static json distrust_payload(const DistrustEdge& edge);

    static std::optional<std::string> encode(const json& payload);

    static std::optional<bytes> encode_trust_edge(const TrustEdge& edge);
    static std::optional<bytes> encode_endorsement(const Endorsement& endorsement);
    static std::optional<bytes> encode_distrust(const DistrustEdge& edge);

private:
    static json number(double value);
};

} // namespace trustpath::core
