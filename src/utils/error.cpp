#include "trustpath/error.hpp"
#include <sstream>

namespace trustpath {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::CryptoSignatureFailed: return "Signature failed";
        case ErrorCode::CryptoKeyGenerationFailed: return "Key generation failed";
        case ErrorCode::InvalidPublicKey: return "Invalid public key";
        case ErrorCode::InvalidSecretKey: return "Invalid secret key";

        case ErrorCode::InvalidSignature: return "Invalid signature";
        case ErrorCode::UnknownSigner: return "Unknown signer";

        case ErrorCode::CyclicDomainHierarchy: return "Cyclic domain hierarchy";
        case ErrorCode::UnknownDomain: return "Unknown domain";

        case ErrorCode::PortUnavailable: return "Graph access port unavailable";

        case ErrorCode::ConfigInvalid: return "Invalid configuration";

        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

bool is_retryable(ErrorCode code) {
    return code == ErrorCode::PortUnavailable;
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace trustpath
