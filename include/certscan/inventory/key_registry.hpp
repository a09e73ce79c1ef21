#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "certscan/artifact.hpp"
#include "certscan/crypto/keys.hpp"
#include "certscan/types.hpp"

namespace certscan {
namespace inventory {

// 从一个对象中提取出的公钥、命名优先级和显示标签
struct KeyExtraction {
    std::shared_ptr<crypto::PublicKey> key;
    NamePriority priority;
    std::string label;
};

// 提取对象关联的公钥
// - 证书: 嵌入的公钥，优先级0，标签为主体名称
// - 证书请求: 嵌入的公钥，优先级1，标签为主体名称
// - RSA私钥: 派生出的公钥，优先级2，标签为文件路径
// - RSA公钥: 本身，优先级3，标签为文件路径
// - CRL: 没有公钥，返回std::nullopt
std::optional<KeyExtraction> ExtractKey(const std::string& path, const Artifact& artifact);

// 对所有出现过的公钥去重并分配唯一的规范名称 "key<名称>"
class KeyRegistry {
public:
    // 每个不同公钥保留的记录
    struct KeyRecord {
        NamePriority priority;
        std::string label;
        std::shared_ptr<crypto::PublicKey> key;
    };

    KeyRegistry() = default;

    // 按提取顺序构建注册表
    // 同一公钥的多个条目中，优先级数值相等或更小的后来者覆盖当前记录；
    // 公钥的排列位置始终是第一次出现的位置。
    static KeyRegistry Build(const std::vector<KeyExtraction>& extractions);

    // 公钥的规范名称，未注册的公钥返回 "???"
    std::string NameOf(const crypto::PublicKey& key) const;

    // 按第一次出现顺序排列的不同公钥，也是签名者的搜索顺序
    const std::vector<std::shared_ptr<crypto::PublicKey>>& OrderedKeys() const { return orderedKeys_; }

    // 按第一次出现顺序排列的获胜记录
    const std::vector<KeyRecord>& Records() const { return records_; }

    size_t Size() const { return orderedKeys_.size(); }

private:
    std::vector<KeyRecord> records_;
    std::vector<std::shared_ptr<crypto::PublicKey>> orderedKeys_;
    // 规范序列化形式 -> "key<名称>"
    std::map<std::string, std::string> names_;
};

} // namespace inventory
} // namespace certscan
