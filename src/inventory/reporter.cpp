#include "certscan/inventory/reporter.hpp"
#include "certscan/inventory/signature_resolver.hpp"
#include "certscan/utils/logger.hpp"
#include <algorithm>
#include <sstream>

namespace certscan {
namespace inventory {

namespace {

const std::string UNKNOWN_ARTIFACT = "Unknown";

std::string describeCertificate(const utils::Certificate& cert, const Artifact& artifact, const KeyRegistry& registry) {
    std::stringstream ss;
    ss << "Certificate for " << cert.GetSubject()
       << "\n    with key " << registry.NameOf(*cert.GetPublicKey())
       << "\n    serial number " << cert.GetSerialNumber()
       << "\n    issued by " << cert.GetIssuer()
       << "\n    signed by " << SignedBy(artifact, registry);
    return ss.str();
}

std::string describeRequest(const utils::CertificateRequest& req, const Artifact& artifact, const KeyRegistry& registry) {
    std::stringstream ss;
    ss << "Certificate request for " << req.GetSubject()
       << "\n    with key " << registry.NameOf(*req.GetPublicKey())
       << "\n    signed by " << SignedBy(artifact, registry);
    return ss.str();
}

std::string describeRevocationList(const utils::RevocationList& crl, const Artifact& artifact, const KeyRegistry& registry) {
    std::vector<std::string> serials = crl.GetRevokedSerials();

    std::stringstream ss;
    ss << "Revocation list revoking ";
    if (serials.empty()) {
        ss << "nothing";
    } else {
        ss << "serial numbers [";
        for (size_t i = 0; i < serials.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << serials[i];
        }
        ss << "]";
    }
    ss << "\n    issued by " << crl.GetIssuer()
       << "\n    signed by " << SignedBy(artifact, registry);
    return ss.str();
}

} // namespace

std::string Describe(const Artifact& artifact, const KeyRegistry& registry) {
    return std::visit(overloaded{
        [&](const std::shared_ptr<utils::Certificate>& cert) {
            return cert ? describeCertificate(*cert, artifact, registry) : UNKNOWN_ARTIFACT;
        },
        [&](const std::shared_ptr<utils::CertificateRequest>& req) {
            return req ? describeRequest(*req, artifact, registry) : UNKNOWN_ARTIFACT;
        },
        [&](const std::shared_ptr<utils::RevocationList>& crl) {
            return crl ? describeRevocationList(*crl, artifact, registry) : UNKNOWN_ARTIFACT;
        },
        [&](const std::shared_ptr<crypto::RSAKey>& key) {
            if (!key || !key->GetPublicKey()) return UNKNOWN_ARTIFACT;
            std::string prefix = key->IsPrivate() ? "Private key for " : "Public key for ";
            return prefix + registry.NameOf(*key->GetPublicKey());
        }
    }, artifact);
}

KeyRegistry BuildRegistry(const storage::ArtifactList& artifacts) {
    std::vector<KeyExtraction> extractions;
    for (const auto& [path, artifact] : artifacts) {
        try {
            auto extraction = ExtractKey(path, artifact);
            if (extraction) {
                extractions.push_back(std::move(*extraction));
            }
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Failed to extract key", utils::LogContext()
                .With("path", path)
                .With("error", e.what()));
        }
    }
    return KeyRegistry::Build(extractions);
}

std::vector<ReportEntry> BuildReport(const storage::ArtifactList& artifacts) {
    // 注册表必须在描述任何对象之前完整构建
    const KeyRegistry registry = BuildRegistry(artifacts);

    std::vector<ReportEntry> entries;
    entries.reserve(artifacts.size());
    for (const auto& [path, artifact] : artifacts) {
        try {
            entries.push_back(ReportEntry{Describe(artifact, registry), path});
        } catch (const std::exception& e) {
            utils::GetLogger().Error("Failed to describe artifact", utils::LogContext()
                .With("path", path)
                .With("error", e.what()));
        }
    }

    std::sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b) {
        if (a.description != b.description) {
            return a.description < b.description;
        }
        return a.path < b.path;
    });

    return entries;
}

void PrintReport(const std::vector<ReportEntry>& entries, std::ostream& out) {
    for (const auto& entry : entries) {
        out << entry.path << ":\n"
            << "  " << entry.description << "\n"
            << "\n";
    }
    out.flush();
}

void RunInventory(const std::vector<std::string>& paths, const ScanConfig& config, std::ostream& out) {
    storage::Collector collector(config, out);
    collector.Collect(paths);

    utils::GetLogger().Info("Scan finished", utils::LogContext()
        .With("artifacts", std::to_string(collector.Artifacts().size()))
        .With("warnings", std::to_string(collector.WarningCount())));

    PrintReport(BuildReport(collector.Artifacts()), out);
}

} // namespace inventory
} // namespace certscan
