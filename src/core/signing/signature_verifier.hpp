#pragma once

#include "core/model/records.hpp"

namespace trustpath::core {

enum class VerifyStatus {
    Valid,
    AlgorithmMismatch,   // record algorithm differs from the registered key's
    KeyMismatch,         // declared key differs from the registered key
    MalformedKey,
    MalformedSignature,
    BadSignature
};

const char* to_string(VerifyStatus status);

/**
 * SignatureVerifier - Stateless check of a record signature against the
 * signer's registered key
 *
 * The key embedded in the record is never trusted on its own; only the
 * registered key supplied by the graph port is used for verification.
 * Never throws.
 */
class SignatureVerifier {
public:
    static VerifyStatus verify(const bytes& canonical,
                               const RecordSignature& signature,
                               const RegisteredKey& registered_key) noexcept;

    static bool is_valid(const bytes& canonical,
                         const RecordSignature& signature,
                         const RegisteredKey& registered_key) noexcept {
        return verify(canonical, signature, registered_key) == VerifyStatus::Valid;
    }

    static bool well_formed_key(const RegisteredKey& key);
};

} // namespace trustpath::core
