#pragma once

#include <vector>
#include <memory>
#include <string>
#include <openssl/evp.h>
#include "certscan/types.hpp"

namespace certscan {
namespace crypto {

// RSA公钥。两个公钥是否"相同"只看规范序列化形式（SubjectPublicKeyInfo的PEM文本）
// 是否逐字节相等，而不是数学上的密钥相等。
class PublicKey {
public:
    // 接管pkey的所有权
    explicit PublicKey(EVP_PKEY* pkey);
    ~PublicKey();

    // 禁用拷贝构造和拷贝赋值
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    PublicKey(PublicKey&& other) noexcept;
    PublicKey& operator=(PublicKey&& other) noexcept;

    // 获取原始EVP_PKEY指针，所有权仍属于本对象
    EVP_PKEY* GetEVPKey() const { return pkey_; }

    // 规范序列化形式，用作密钥身份
    const std::string& Canonical() const { return canonical_; }

    // 密钥位数
    int Bits() const;

private:
    EVP_PKEY* pkey_ = nullptr;
    std::string canonical_;
};

// 从PEM文件中解析出的RSA密钥（私钥或公钥）
class RSAKey {
public:
    RSAKey(bool isPrivate, std::shared_ptr<PublicKey> publicKey)
        : isPrivate_(isPrivate), publicKey_(std::move(publicKey)) {}

    bool IsPrivate() const { return isPrivate_; }

    // 私钥时为派生出的公钥部分，公钥时为其本身
    std::shared_ptr<PublicKey> GetPublicKey() const { return publicKey_; }

private:
    bool isPrivate_;
    std::shared_ptr<PublicKey> publicKey_;
};

// 复制EVP_PKEY中的公钥部分，私钥材料不会被保留
// 返回值: 新的公钥对象；不是RSA密钥或编码失败时抛出std::runtime_error
std::shared_ptr<PublicKey> PublicKeyFromEVP(EVP_PKEY* pkey);

// 解析 "RSA PRIVATE KEY" PEM数据
// 加密的私钥不会提示输入密码，直接解析失败
Result<std::shared_ptr<RSAKey>> ParseRSAPrivateKeyPEM(const std::string& pemData);

// 解析 "RSA PUBLIC KEY" (PKCS#1) PEM数据
Result<std::shared_ptr<RSAKey>> ParseRSAPublicKeyPEM(const std::string& pemData);

// 取出并清空OpenSSL错误队列，返回可读的错误描述
std::string DrainOpenSSLErrors();

} // namespace crypto
} // namespace certscan
