#include "certscan/inventory/key_registry.hpp"
#include "certscan/utils/logger.hpp"
#include <set>

namespace certscan {
namespace inventory {

std::optional<KeyExtraction> ExtractKey(const std::string& path, const Artifact& artifact) {
    return std::visit(overloaded{
        [](const std::shared_ptr<utils::Certificate>& cert) -> std::optional<KeyExtraction> {
            return KeyExtraction{cert->GetPublicKey(), NamePriority::CertificateSubject, cert->GetSubject()};
        },
        [](const std::shared_ptr<utils::CertificateRequest>& req) -> std::optional<KeyExtraction> {
            return KeyExtraction{req->GetPublicKey(), NamePriority::RequestSubject, req->GetSubject()};
        },
        [](const std::shared_ptr<utils::RevocationList>&) -> std::optional<KeyExtraction> {
            return std::nullopt;
        },
        [&path](const std::shared_ptr<crypto::RSAKey>& key) -> std::optional<KeyExtraction> {
            NamePriority priority = key->IsPrivate() ? NamePriority::PrivateKeyFile : NamePriority::PublicKeyFile;
            return KeyExtraction{key->GetPublicKey(), priority, path};
        }
    }, artifact);
}

KeyRegistry KeyRegistry::Build(const std::vector<KeyExtraction>& extractions) {
    KeyRegistry registry;

    // 1. 按公钥身份分组，记录第一次出现的位置
    std::map<std::string, size_t> firstSeen;
    for (const auto& extraction : extractions) {
        if (!extraction.key) continue;

        const std::string& identity = extraction.key->Canonical();
        auto it = firstSeen.find(identity);
        if (it == firstSeen.end()) {
            firstSeen.emplace(identity, registry.records_.size());
            registry.records_.push_back(KeyRecord{extraction.priority, extraction.label, extraction.key});
            registry.orderedKeys_.push_back(extraction.key);
            continue;
        }

        // 优先级相等时后出现的条目获胜
        KeyRecord& current = registry.records_[it->second];
        if (static_cast<int>(extraction.priority) <= static_cast<int>(current.priority)) {
            current.priority = extraction.priority;
            current.label = extraction.label;
        }
    }

    // 2. 按第一次出现顺序分配名称，重名时追加 " (2)"、" (3)" ...
    std::set<std::string> taken;
    for (const auto& record : registry.records_) {
        std::string name = record.label;
        if (taken.count(name) > 0) {
            int suffix = 2;
            while (taken.count(record.label + " (" + std::to_string(suffix) + ")") > 0) {
                ++suffix;
            }
            name = record.label + " (" + std::to_string(suffix) + ")";
        }
        taken.insert(name);

        // 3. 规范名称
        registry.names_[record.key->Canonical()] = "key<" + name + ">";

        utils::GetLogger().Debug("Registered key", utils::LogContext()
            .With("name", name)
            .With("priority", std::to_string(static_cast<int>(record.priority)))
            .With("bits", std::to_string(record.key->Bits())));
    }

    return registry;
}

std::string KeyRegistry::NameOf(const crypto::PublicKey& key) const {
    auto it = names_.find(key.Canonical());
    if (it == names_.end()) {
        return UNKNOWN_SIGNER;
    }
    return it->second;
}

} // namespace inventory
} // namespace certscan
