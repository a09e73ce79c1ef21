#include "certscan/inventory/signature_resolver.hpp"

namespace certscan {
namespace inventory {

bool VerifiedBy(const Artifact& artifact, const crypto::PublicKey& key) {
    return std::visit(overloaded{
        [&key](const std::shared_ptr<utils::Certificate>& cert) { return cert->VerifySignature(key); },
        [&key](const std::shared_ptr<utils::CertificateRequest>& req) { return req->VerifySignature(key); },
        [&key](const std::shared_ptr<utils::RevocationList>& crl) { return crl->VerifySignature(key); },
        [](const std::shared_ptr<crypto::RSAKey>&) { return false; }
    }, artifact);
}

std::string SignedBy(const Artifact& artifact, const KeyRegistry& registry) {
    for (const auto& key : registry.OrderedKeys()) {
        if (VerifiedBy(artifact, *key)) {
            return registry.NameOf(*key);
        }
    }
    return UNKNOWN_SIGNER;
}

} // namespace inventory
} // namespace certscan
