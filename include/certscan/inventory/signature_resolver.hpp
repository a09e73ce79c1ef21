#pragma once

#include <string>
#include "certscan/artifact.hpp"
#include "certscan/inventory/key_registry.hpp"

namespace certscan {
namespace inventory {

// 检查对象的签名能否被给定公钥验证。RSA密钥文件没有签名，总是返回false
bool VerifiedBy(const Artifact& artifact, const crypto::PublicKey& key);

// 按注册表顺序查找第一个能验证对象签名的公钥，返回其规范名称
// 没有匹配的公钥时返回 "???"
std::string SignedBy(const Artifact& artifact, const KeyRegistry& registry);

} // namespace inventory
} // namespace certscan
