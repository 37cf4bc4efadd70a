#include "core/query/query_contract.hpp"
#include "trustpath/time_utils.hpp"

namespace trustpath::core {

namespace {
    Result<TrustQuery> bad_request(const std::string& message) {
        return Result<TrustQuery>::Err(ErrorCode::InvalidArgument, message);
    }
}

Result<TrustQuery> query_from_json(const json& j) {
    if (!j.is_object()) {
        return bad_request("query must be a JSON object");
    }

    TrustQuery query;
    for (const char* field : {"source", "target", "domain"}) {
        if (!j.contains(field) || !j.at(field).is_string()) {
            return bad_request(std::string("'") + field + "' must be a string");
        }
    }
    query.source = j.at("source").get<std::string>();
    query.target = j.at("target").get<std::string>();
    query.domain = j.at("domain").get<std::string>();

    if (j.contains("maxDepth") && !j.at("maxDepth").is_null()) {
        const auto& depth = j.at("maxDepth");
        if (!depth.is_number_integer() || depth.get<int64_t>() < 0 ||
            depth.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
            return bad_request("'maxDepth' must be a non-negative integer");
        }
        query.max_depth = static_cast<uint32_t>(depth.get<int64_t>());
    }
    if (j.contains("minConfidence") && !j.at("minConfidence").is_null()) {
        const auto& min_confidence = j.at("minConfidence");
        if (!min_confidence.is_number()) {
            return bad_request("'minConfidence' must be a number");
        }
        query.min_confidence = min_confidence.get<double>();
    }
    return Result<TrustQuery>::Ok(query);
}

json to_json(const TrustQuery& query) {
    json j{{"source", query.source}, {"target", query.target}, {"domain", query.domain}};
    if (query.max_depth) {
        j["maxDepth"] = *query.max_depth;
    }
    if (query.min_confidence) {
        j["minConfidence"] = *query.min_confidence;
    }
    return j;
}

json to_json(const QueryStats& stats) {
    json j{
        {"edgesConsidered", stats.edges_considered},
        {"invalidSignature", stats.invalid_signature},
        {"unknownSigner", stats.unknown_signer},
        {"expired", stats.expired},
        {"malformed", stats.malformed},
        {"domainMismatch", stats.domain_mismatch},
        {"fanoutPruned", stats.fanout_pruned},
        {"confidencePruned", stats.confidence_pruned},
        {"distrustExcluded", stats.distrust_excluded},
        {"nodesVisited", stats.nodes_visited}
    };
    if (stats.truncation_reason != TruncationReason::None) {
        j["truncationReason"] = to_string(stats.truncation_reason);
    }
    return j;
}

json to_json(const TrustResult& result) {
    json explanation = json::array();
    for (const auto& entry : result.explanation) {
        explanation.push_back({
            {"path", entry.path},
            {"rawConfidence", entry.raw_confidence},
            {"appliedDiscount", entry.applied_discount}
        });
    }
    return json{
        {"score", result.score},
        {"confidence", result.confidence},
        {"explanation", explanation},
        {"computedAt", time::timestamp_to_iso8601(result.computed_at)},
        {"truncated", result.truncated},
        {"belowMinConfidence", result.below_min_confidence},
        {"fromCache", result.from_cache},
        {"targetKind", to_string(result.target_kind)},
        {"maxDepth", result.max_depth},
        {"stats", to_json(result.stats)}
    };
}

json to_json(const EngineStats& stats) {
    return json{
        {"queries", stats.queries},
        {"cacheHits", stats.cache_hits},
        {"coalesced", stats.coalesced},
        {"computations", stats.computations},
        {"truncated", stats.truncated},
        {"portFailures", stats.port_failures},
        {"rejectedQueries", stats.rejected_queries},
        {"invalidSignature", stats.invalid_signature},
        {"unknownSigner", stats.unknown_signer},
        {"expired", stats.expired},
        {"malformed", stats.malformed},
        {"domainMismatch", stats.domain_mismatch},
        {"invalidations", stats.invalidations}
    };
}

json error_to_json(const Error& error) {
    json j{
        {"error", error_code_to_string(error.code())},
        {"message", error.message()},
        {"retryable", error.retryable()}
    };
    if (!error.details().empty()) {
        j["details"] = error.details();
    }
    return j;
}

} // namespace trustpath::core
