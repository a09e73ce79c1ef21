#include "certscan/artifact.hpp"

namespace certscan {

namespace {

// 把类型化的解析结果转换为Artifact结果
template<typename T>
Result<Artifact> toArtifact(Result<std::shared_ptr<T>>&& parsed) {
    if (!parsed.ok()) {
        return parsed.error();
    }
    return Artifact(std::move(parsed).value());
}

} // namespace

Result<Artifact> Classify(const std::string& contents) {
    std::string firstLine = contents.substr(0, contents.find('\n'));

    // CERTIFICATE REQUEST 必须在 CERTIFICATE 之前检查
    if (firstLine.find(PEM_CRL_MARKER) != std::string::npos) {
        return toArtifact(utils::LoadRevocationListFromPEM(contents));
    }
    if (firstLine.find(PEM_REQUEST_MARKER) != std::string::npos) {
        return toArtifact(utils::LoadCertificateRequestFromPEM(contents));
    }
    if (firstLine.find(PEM_CERTIFICATE_MARKER) != std::string::npos) {
        return toArtifact(utils::LoadCertificateFromPEM(contents));
    }
    if (firstLine.find(PEM_RSA_PRIVATE_KEY_MARKER) != std::string::npos) {
        return toArtifact(crypto::ParseRSAPrivateKeyPEM(contents));
    }
    if (firstLine.find(PEM_RSA_PUBLIC_KEY_MARKER) != std::string::npos) {
        return toArtifact(crypto::ParseRSAPublicKeyPEM(contents));
    }

    return Error("no recognized PEM header on first line");
}

std::string ArtifactKind(const Artifact& artifact) {
    return std::visit(overloaded{
        [](const std::shared_ptr<utils::Certificate>&) -> std::string { return "certificate"; },
        [](const std::shared_ptr<utils::CertificateRequest>&) -> std::string { return "certificate request"; },
        [](const std::shared_ptr<utils::RevocationList>&) -> std::string { return "revocation list"; },
        [](const std::shared_ptr<crypto::RSAKey>& key) -> std::string {
            return key->IsPrivate() ? "RSA private key" : "RSA public key";
        }
    }, artifact);
}

} // namespace certscan
