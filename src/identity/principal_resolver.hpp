#pragma once

#include "core/model/records.hpp"
#include "trustpath/error.hpp"
#include <map>
#include <mutex>

namespace trustpath::identity {

/**
 * PresentedCredential - What a caller shows to claim a principal identity.
 * The optional proof is a signature over `challenge` made with the key.
 */
struct PresentedCredential {
    core::SignatureAlgorithm algorithm = core::SignatureAlgorithm::ED25519;
    bytes public_key;
    std::optional<bytes> challenge;
    std::optional<bytes> proof;
};

/**
 * PrincipalResolver - Maps an authenticated caller to a PrincipalId
 *
 * Lives in front of the query engine; the engine only ever sees the
 * resolved id.
 */
class PrincipalResolver {
public:
    virtual ~PrincipalResolver() = default;

    virtual Result<PrincipalId> resolve(const PresentedCredential& credential) const = 0;
};

/**
 * KeyRegistryResolver - Resolves by exact match on a registered public key
 */
class KeyRegistryResolver : public PrincipalResolver {
public:
    KeyRegistryResolver() = default;
    explicit KeyRegistryResolver(const std::vector<core::Principal>& principals);

    void register_principal(const core::Principal& principal);
    bool unregister(const PrincipalId& id);
    size_t size() const;

    /**
     * @return UnknownSigner if no principal holds the key, InvalidPublicKey
     *         for a malformed key, InvalidSignature if a proof is supplied
     *         and does not verify
     */
    Result<PrincipalId> resolve(const PresentedCredential& credential) const override;

private:
    using KeyIndex = std::pair<core::SignatureAlgorithm, bytes>;

    mutable std::mutex mutex_;
    std::map<KeyIndex, PrincipalId> by_key_;
};

} // namespace trustpath::identity
