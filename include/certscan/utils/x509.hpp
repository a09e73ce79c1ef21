#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <openssl/x509.h>
#include "certscan/crypto/keys.hpp"
#include "certscan/types.hpp"

namespace certscan {
namespace utils {

// 证书相关错误类
class CertificateError : public std::runtime_error {
public:
    explicit CertificateError(const std::string& message)
        : std::runtime_error("Certificate error: " + message) {}
};

// X509证书包装类
class Certificate {
public:
    Certificate() = default;
    // 接管cert的所有权
    explicit Certificate(X509* cert);
    ~Certificate();

    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    Certificate(Certificate&& other) noexcept;
    Certificate& operator=(Certificate&& other) noexcept;

    X509* GetX509() const { return cert_; }

    // RFC 2253 格式的主体名称，例如 "CN=Root"
    std::string GetSubject() const;

    // RFC 2253 格式的颁发者名称
    std::string GetIssuer() const;

    // 十进制序列号
    std::string GetSerialNumber() const;

    // 证书中嵌入的公钥
    std::shared_ptr<crypto::PublicKey> GetPublicKey() const;

    // 检查证书签名是否能被给定公钥验证
    bool VerifySignature(const crypto::PublicKey& key) const;

private:
    X509* cert_ = nullptr;
};

// 证书签名请求(CSR)包装类
class CertificateRequest {
public:
    CertificateRequest() = default;
    // 接管req的所有权
    explicit CertificateRequest(X509_REQ* req);
    ~CertificateRequest();

    CertificateRequest(const CertificateRequest&) = delete;
    CertificateRequest& operator=(const CertificateRequest&) = delete;

    CertificateRequest(CertificateRequest&& other) noexcept;
    CertificateRequest& operator=(CertificateRequest&& other) noexcept;

    X509_REQ* GetX509Req() const { return req_; }

    std::string GetSubject() const;
    std::shared_ptr<crypto::PublicKey> GetPublicKey() const;
    bool VerifySignature(const crypto::PublicKey& key) const;

private:
    X509_REQ* req_ = nullptr;
};

// 证书吊销列表(CRL)包装类
class RevocationList {
public:
    RevocationList() = default;
    // 接管crl的所有权
    explicit RevocationList(X509_CRL* crl);
    ~RevocationList();

    RevocationList(const RevocationList&) = delete;
    RevocationList& operator=(const RevocationList&) = delete;

    RevocationList(RevocationList&& other) noexcept;
    RevocationList& operator=(RevocationList&& other) noexcept;

    X509_CRL* GetX509Crl() const { return crl_; }

    std::string GetIssuer() const;

    // 按CRL中出现的顺序返回被吊销证书的十进制序列号
    std::vector<std::string> GetRevokedSerials() const;

    bool VerifySignature(const crypto::PublicKey& key) const;

private:
    X509_CRL* crl_ = nullptr;
};

// 从PEM数据解析证书
Result<std::shared_ptr<Certificate>> LoadCertificateFromPEM(const std::string& pemData);

// 从PEM数据解析证书签名请求
Result<std::shared_ptr<CertificateRequest>> LoadCertificateRequestFromPEM(const std::string& pemData);

// 从PEM数据解析证书吊销列表
Result<std::shared_ptr<RevocationList>> LoadRevocationListFromPEM(const std::string& pemData);

// 将X509_NAME格式化为RFC 2253字符串，失败时抛出CertificateError
std::string FormatName(const X509_NAME* name);

// 将ASN1_INTEGER格式化为十进制字符串，失败时抛出CertificateError
std::string FormatSerial(const ASN1_INTEGER* serial);

} // namespace utils
} // namespace certscan
