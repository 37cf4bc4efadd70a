#include "core/model/record_json.hpp"
#include "trustpath/time_utils.hpp"
#include <stdexcept>

namespace trustpath::core {

namespace {
    // Field accessors throw json::exception on missing keys or wrong types;
    // the public decoders translate that into DeserializationFailed.
    std::string required_string(const json& j, const char* key) {
        return j.at(key).get<std::string>();
    }

    uint64_t required_time(const json& j, const char* key) {
        return time::iso8601_to_timestamp(j.at(key).get<std::string>());
    }

    std::optional<uint64_t> optional_time(const json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::nullopt;
        }
        return time::iso8601_to_timestamp(j.at(key).get<std::string>());
    }

    bytes required_base64(const json& j, const char* key) {
        auto decoded = decode_base64_strict(j.at(key).get<std::string>());
        if (!decoded) {
            throw std::invalid_argument(std::string("field '") + key + "' is not canonical base64");
        }
        return *decoded;
    }

    SignatureAlgorithm required_algorithm(const json& j, const char* key) {
        auto algorithm = parse_signature_algorithm(j.at(key).get<std::string>());
        if (!algorithm) {
            throw std::invalid_argument("unsupported signature algorithm");
        }
        return *algorithm;
    }

    template<typename T, typename F>
    Result<T> decode(const char* what, const json& j, F&& body) {
        if (!j.is_object()) {
            return Result<T>::Err(ErrorCode::DeserializationFailed, std::string(what) + " must be an object");
        }
        try {
            return Result<T>::Ok(body());
        } catch (const json::exception& e) {
            return Result<T>::Err(Error(ErrorCode::DeserializationFailed,
                std::string("Malformed ") + what, e.what()));
        } catch (const std::invalid_argument& e) {
            return Result<T>::Err(Error(ErrorCode::DeserializationFailed,
                std::string("Malformed ") + what, e.what()));
        } catch (const std::runtime_error& e) {
            return Result<T>::Err(Error(ErrorCode::DeserializationFailed,
                std::string("Malformed ") + what, e.what()));
        }
    }
}

std::optional<bytes> decode_base64_strict(const std::string& encoded) {
    auto decoded = base64_decode(encoded);
    if (!decoded || base64_encode(*decoded) != encoded) {
        return std::nullopt;
    }
    return decoded;
}

json to_json(const RecordSignature& signature) {
    return json{
        {"algorithm", to_string(signature.algorithm)},
        {"publicKey", base64_encode(signature.public_key)},
        {"signature", base64_encode(signature.signature)},
        {"signedAt", time::timestamp_to_iso8601(signature.signed_at)}
    };
}

json to_json(const Principal& principal) {
    json j{
        {"id", principal.id},
        {"type", to_string(principal.type)},
        {"algorithm", to_string(principal.public_key.algorithm)},
        {"publicKey", base64_encode(principal.public_key.key)},
        {"createdAt", time::timestamp_to_iso8601(principal.created_at)}
    };
    if (!principal.metadata.empty()) {
        j["metadata"] = principal.metadata;
    }
    return j;
}

json to_json(const Subject& subject) {
    json j{
        {"id", subject.id},
        {"type", to_string(subject.type)},
        {"domains", subject.domains},
        {"externalIds", subject.external_ids}
    };
    if (subject.location) {
        j["location"] = {{"latitude", subject.location->latitude},
                         {"longitude", subject.location->longitude}};
    }
    return j;
}

json to_json(const Domain& domain) {
    json j{{"id", domain.id}, {"name", domain.name}};
    if (domain.parent) {
        j["parent"] = *domain.parent;
    }
    return j;
}

json to_json(const TrustEdge& edge) {
    json j{
        {"from", edge.from},
        {"to", edge.to},
        {"domain", edge.domain},
        {"weight", edge.weight},
        {"issuedAt", time::timestamp_to_iso8601(edge.issued_at)},
        {"signature", to_json(edge.signature)}
    };
    if (edge.expires_at) {
        j["expiresAt"] = time::timestamp_to_iso8601(*edge.expires_at);
    }
    return j;
}

json to_json(const Endorsement& endorsement) {
    json j{
        {"from", endorsement.from},
        {"to", endorsement.to},
        {"domain", endorsement.domain},
        {"weight", endorsement.weight},
        {"issuedAt", time::timestamp_to_iso8601(endorsement.issued_at)},
        {"signature", to_json(endorsement.signature)}
    };
    if (endorsement.expires_at) {
        j["expiresAt"] = time::timestamp_to_iso8601(*endorsement.expires_at);
    }
    return j;
}

json to_json(const DistrustEdge& edge) {
    json j{
        {"from", edge.from},
        {"to", edge.to},
        {"domain", edge.domain},
        {"reason", to_string(edge.reason)},
        {"issuedAt", time::timestamp_to_iso8601(edge.issued_at)},
        {"signature", to_json(edge.signature)}
    };
    if (edge.expires_at) {
        j["expiresAt"] = time::timestamp_to_iso8601(*edge.expires_at);
    }
    return j;
}

Result<RecordSignature> signature_from_json(const json& j) {
    return decode<RecordSignature>("signature", j, [&]() {
        RecordSignature signature;
        signature.algorithm = required_algorithm(j, "algorithm");
        signature.public_key = required_base64(j, "publicKey");
        signature.signature = required_base64(j, "signature");
        signature.signed_at = required_time(j, "signedAt");
        return signature;
    });
}

Result<Principal> principal_from_json(const json& j) {
    return decode<Principal>("principal", j, [&]() {
        Principal principal;
        principal.id = required_string(j, "id");
        auto type = parse_principal_type(j.value("type", std::string("user")));
        if (!type) {
            throw std::invalid_argument("unknown principal type");
        }
        principal.type = *type;
        principal.public_key.algorithm = required_algorithm(j, "algorithm");
        principal.public_key.key = required_base64(j, "publicKey");
        principal.created_at = required_time(j, "createdAt");
        if (j.contains("metadata")) {
            principal.metadata = j.at("metadata").get<std::map<std::string, std::string>>();
        }
        return principal;
    });
}

Result<Subject> subject_from_json(const json& j) {
    return decode<Subject>("subject", j, [&]() {
        Subject subject;
        subject.id = required_string(j, "id");
        auto type = parse_subject_type(j.value("type", std::string("business")));
        if (!type) {
            throw std::invalid_argument("unknown subject type");
        }
        subject.type = *type;
        if (j.contains("domains")) {
            subject.domains = j.at("domains").get<std::set<DomainId>>();
        }
        if (j.contains("location")) {
            const auto& loc = j.at("location");
            subject.location = GeoLocation{loc.at("latitude").get<double>(), loc.at("longitude").get<double>()};
        }
        if (j.contains("externalIds")) {
            subject.external_ids = j.at("externalIds").get<std::map<std::string, std::string>>();
        }
        return subject;
    });
}

Result<Domain> domain_from_json(const json& j) {
    return decode<Domain>("domain", j, [&]() {
        Domain domain;
        domain.id = required_string(j, "id");
        domain.name = j.value("name", domain.id);
        if (j.contains("parent") && !j.at("parent").is_null()) {
            domain.parent = j.at("parent").get<std::string>();
        }
        return domain;
    });
}

Result<TrustEdge> trust_edge_from_json(const json& j) {
    return decode<TrustEdge>("trust edge", j, [&]() {
        TrustEdge edge;
        edge.from = required_string(j, "from");
        edge.to = required_string(j, "to");
        edge.domain = required_string(j, "domain");
        edge.weight = j.at("weight").get<double>();
        edge.issued_at = required_time(j, "issuedAt");
        edge.expires_at = optional_time(j, "expiresAt");
        auto signature = signature_from_json(j.at("signature"));
        if (signature.is_err()) {
            throw std::invalid_argument(signature.error().to_string());
        }
        edge.signature = signature.value();
        return edge;
    });
}

Result<Endorsement> endorsement_from_json(const json& j) {
    return decode<Endorsement>("endorsement", j, [&]() {
        Endorsement endorsement;
        endorsement.from = required_string(j, "from");
        endorsement.to = required_string(j, "to");
        endorsement.domain = required_string(j, "domain");
        endorsement.weight = j.at("weight").get<double>();
        endorsement.issued_at = required_time(j, "issuedAt");
        endorsement.expires_at = optional_time(j, "expiresAt");
        auto signature = signature_from_json(j.at("signature"));
        if (signature.is_err()) {
            throw std::invalid_argument(signature.error().to_string());
        }
        endorsement.signature = signature.value();
        return endorsement;
    });
}

Result<DistrustEdge> distrust_edge_from_json(const json& j) {
    return decode<DistrustEdge>("distrust edge", j, [&]() {
        DistrustEdge edge;
        edge.from = required_string(j, "from");
        edge.to = required_string(j, "to");
        edge.domain = required_string(j, "domain");
        auto reason = parse_distrust_reason(j.value("reason", std::string("other")));
        if (!reason) {
            throw std::invalid_argument("unknown distrust reason");
        }
        edge.reason = *reason;
        edge.issued_at = required_time(j, "issuedAt");
        edge.expires_at = optional_time(j, "expiresAt");
        auto signature = signature_from_json(j.at("signature"));
        if (signature.is_err()) {
            throw std::invalid_argument(signature.error().to_string());
        }
        edge.signature = signature.value();
        return edge;
    });
}

} // namespace trustpath::core
