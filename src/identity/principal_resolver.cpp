#include "identity/principal_resolver.hpp"
#include "core/signing/signature_verifier.hpp"
#include "utils/logger.hpp"

namespace trustpath::identity {

KeyRegistryResolver::KeyRegistryResolver(const std::vector<core::Principal>& principals) {
    for (const auto& principal : principals) {
        register_principal(principal);
    }
}

void KeyRegistryResolver::register_principal(const core::Principal& principal) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A re-keyed principal must not stay reachable through its old key
    for (auto it = by_key_.begin(); it != by_key_.end();) {
        if (it->second == principal.id) {
            it = by_key_.erase(it);
        } else {
            ++it;
        }
    }
    by_key_[{principal.public_key.algorithm, principal.public_key.key}] = principal.id;
}

bool KeyRegistryResolver::unregister(const PrincipalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = by_key_.begin(); it != by_key_.end(); ++it) {
        if (it->second == id) {
            by_key_.erase(it);
            return true;
        }
    }
    return false;
}

size_t KeyRegistryResolver::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_key_.size();
}

Result<PrincipalId> KeyRegistryResolver::resolve(const PresentedCredential& credential) const {
    core::RegisteredKey key{credential.algorithm, credential.public_key};
    if (!core::SignatureVerifier::well_formed_key(key)) {
        return Result<PrincipalId>::Err(ErrorCode::InvalidPublicKey, "Malformed public key");
    }

    PrincipalId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_key_.find({credential.algorithm, credential.public_key});
        if (it == by_key_.end()) {
            return Result<PrincipalId>::Err(ErrorCode::UnknownSigner,
                                            "No principal registered for this key");
        }
        id = it->second;
    }

    if (credential.proof) {
        if (!credential.challenge) {
            return Result<PrincipalId>::Err(ErrorCode::InvalidArgument,
                                            "A proof requires the signed challenge");
        }
        core::RecordSignature signature;
        signature.algorithm = credential.algorithm;
        signature.public_key = credential.public_key;
        signature.signature = *credential.proof;
        if (!core::SignatureVerifier::is_valid(*credential.challenge, signature, key)) {
            TRUSTPATH_LOG_WARN("Possession proof rejected for principal {}", short_id(id));
            return Result<PrincipalId>::Err(ErrorCode::InvalidSignature,
                                            "Proof of key possession failed");
        }
    }
    return Result<PrincipalId>::Ok(id);
}

} // namespace trustpath::identity
