#include <iostream>
#include <fstream>
#include <memory>

// Core components
#include "core/query/query_contract.hpp"
#include "core/query/query_engine.hpp"
#include "core/model/record_json.hpp"

// Storage
#include "storage/memory_graph_store.hpp"

// Identity
#include "identity/principal_resolver.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "trustpath/common.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <graph.json> <query.json> [config.json]\n"
              << "\n"
              << "Evaluates one trust query against a graph document and prints the\n"
              << "JSON result. The query may name its source by \"sourceKey\"\n"
              << "({algorithm, publicKey}) instead of \"source\".\n";
}

trustpath::utils::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw trustpath::TrustPathException(trustpath::ErrorCode::InvalidArgument,
                                            "Cannot open " + path);
    }
    auto document = trustpath::utils::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        throw trustpath::TrustPathException(trustpath::ErrorCode::InvalidFormat,
                                            path + " is not valid JSON");
    }
    return document;
}

// Replace a "sourceKey" credential with the principal id it resolves to
trustpath::Result<trustpath::utils::json> resolve_source(
    trustpath::utils::json request,
    const trustpath::identity::PrincipalResolver& resolver)
{
    using trustpath::Result;
    using trustpath::utils::json;

    if (!request.is_object() || !request.contains("sourceKey")) {
        return Result<json>::Ok(std::move(request));
    }
    const auto& key = request.at("sourceKey");
    if (!key.is_object() || !key.contains("algorithm") || !key.contains("publicKey") ||
        !key.at("algorithm").is_string() || !key.at("publicKey").is_string()) {
        return Result<json>::Err(trustpath::ErrorCode::InvalidArgument,
                                 "'sourceKey' needs string fields algorithm and publicKey");
    }
    auto algorithm = trustpath::core::parse_signature_algorithm(key.at("algorithm").get<std::string>());
    auto public_key = trustpath::core::decode_base64_strict(key.at("publicKey").get<std::string>());
    if (!algorithm || !public_key) {
        return Result<json>::Err(trustpath::ErrorCode::InvalidPublicKey,
                                 "'sourceKey' is not a valid key");
    }

    trustpath::identity::PresentedCredential credential;
    credential.algorithm = *algorithm;
    credential.public_key = *public_key;
    auto principal = resolver.resolve(credential);
    if (principal.is_err()) {
        return Result<json>::Err(principal.error());
    }
    request["source"] = principal.value();
    request.erase("sourceKey");
    return Result<json>::Ok(std::move(request));
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        // Load configuration (or use defaults if no file was given)
        trustpath::utils::Config config;
        if (argc == 4) {
            config = trustpath::utils::Config::load_from_file(argv[3]);
        }

        // Initialize logging
        auto log_level = config.get_or<std::string>("log_level", "warn");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        trustpath::utils::Logger::init(log_level, log_to_file);

        TRUSTPATH_LOG_INFO("TrustPath v{}.{}.{}",
            TRUSTPATH_VERSION_MAJOR,
            TRUSTPATH_VERSION_MINOR,
            TRUSTPATH_VERSION_PATCH
        );

        auto engine_config = trustpath::core::EngineConfig::from_config(config);
        if (engine_config.is_err()) {
            std::cout << trustpath::core::error_to_json(engine_config.error()).dump(2) << std::endl;
            return 1;
        }

        // 1. Graph store
        auto store = std::make_shared<trustpath::storage::MemoryGraphStore>();
        auto loaded = store->load_from_file(argv[1]);
        if (loaded.is_err()) {
            std::cout << trustpath::core::error_to_json(loaded.error()).dump(2) << std::endl;
            return 1;
        }

        // 2. Query
        trustpath::identity::KeyRegistryResolver resolver(store->principals());
        auto request = resolve_source(read_json_file(argv[2]), resolver);
        if (request.is_err()) {
            std::cout << trustpath::core::error_to_json(request.error()).dump(2) << std::endl;
            return 1;
        }
        auto query = trustpath::core::query_from_json(request.value());
        if (query.is_err()) {
            std::cout << trustpath::core::error_to_json(query.error()).dump(2) << std::endl;
            return 1;
        }

        // 3. Evaluate
        trustpath::core::TrustQueryEngine engine(store, engine_config.value());
        auto result = engine.evaluate(query.value());
        if (result.is_err()) {
            std::cout << trustpath::core::error_to_json(result.error()).dump(2) << std::endl;
            return result.error().retryable() ? 3 : 1;
        }

        std::cout << trustpath::core::to_json(result.value()).dump(2) << std::endl;
        return 0;

    } catch (const trustpath::TrustPathException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
