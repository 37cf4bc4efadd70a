#pragma once

#include "core/model/records.hpp"
#include "trustpath/error.hpp"
#include <nlohmann/json.hpp>

namespace trustpath::core {

using json = nlohmann::json;

/**
 * JSON codecs for trust records as exchanged with storage adapters and
 * write-side producers. Timestamps are ISO 8601 strings, keys and
 * signatures are base64.
 */

json to_json(const RecordSignature& signature);
json to_json(const Principal& principal);
json to_json(const Subject& subject);
json to_json(const Domain& domain);
json to_json(const TrustEdge& edge);
json to_json(const Endorsement& endorsement);
json to_json(const DistrustEdge& edge);

Result<RecordSignature> signature_from_json(const json& j);
Result<Principal> principal_from_json(const json& j);
Result<Subject> subject_from_json(const json& j);
Result<Domain> domain_from_json(const json& j);
Result<TrustEdge> trust_edge_from_json(const json& j);
Result<Endorsement> endorsement_from_json(const json& j);
Result<DistrustEdge> distrust_edge_from_json(const json& j);

// Base64 decode that rejects anything but the canonical encoding
std::optional<bytes> decode_base64_strict(const std::string& encoded);

} // namespace trustpath::core
