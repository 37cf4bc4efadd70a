#pragma once

#include "core/query/query_engine.hpp"
#include <nlohmann/json.hpp>

namespace trustpath::core {

using json = nlohmann::json;

/**
 * JSON surface consumed by the API layer.
 *
 * Request:  {source, target, domain, maxDepth?, minConfidence?}
 * Response: {score, confidence, explanation[{path, rawConfidence,
 *            appliedDiscount}], computedAt, truncated, belowMinConfidence,
 *            fromCache, targetKind, maxDepth, stats{...}}
 */
Result<TrustQuery> query_from_json(const json& j);

json to_json(const TrustQuery& query);
json to_json(const TrustResult& result);
json to_json(const QueryStats& stats);
json to_json(const EngineStats& stats);

// Error body for failed queries: {error, message, details?, retryable}
json error_to_json(const Error& error);

} // namespace trustpath::core
