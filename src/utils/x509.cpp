#include "certscan/utils/x509.hpp"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/asn1.h>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace certscan {
namespace utils {

namespace {

// 取出X509结构中的公钥并转换为PublicKey对象；pkey由调用方获得引用，这里负责释放
std::shared_ptr<crypto::PublicKey> adoptPublicKey(EVP_PKEY* pkey, const char* what) {
    if (!pkey) {
        throw CertificateError(std::string("no public key in ") + what + ": " + crypto::DrainOpenSSLErrors());
    }
    try {
        auto key = crypto::PublicKeyFromEVP(pkey);
        EVP_PKEY_free(pkey);
        return key;
    } catch (const std::exception& e) {
        EVP_PKEY_free(pkey);
        throw CertificateError(std::string("unsupported public key in ") + what + ": " + e.what());
    }
}

// 签名验证结果：1成功，0不匹配，-1出错。不匹配时清理错误队列
bool checkVerifyResult(int result) {
    if (result != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace

// Certificate类实现

Certificate::Certificate(X509* cert) : cert_(cert) {}

Certificate::~Certificate() {
    if (cert_) {
        X509_free(cert_);
    }
}

Certificate::Certificate(Certificate&& other) noexcept : cert_(other.cert_) {
    other.cert_ = nullptr;
}

Certificate& Certificate::operator=(Certificate&& other) noexcept {
    if (this != &other) {
        if (cert_) {
            X509_free(cert_);
        }
        cert_ = other.cert_;
        other.cert_ = nullptr;
    }
    return *this;
}

std::string Certificate::GetSubject() const {
    if (!cert_) throw CertificateError("certificate is null");
    return FormatName(X509_get_subject_name(cert_));
}

std::string Certificate::GetIssuer() const {
    if (!cert_) throw CertificateError("certificate is null");
    return FormatName(X509_get_issuer_name(cert_));
}

std::string Certificate::GetSerialNumber() const {
    if (!cert_) throw CertificateError("certificate is null");
    return FormatSerial(X509_get0_serialNumber(cert_));
}

std::shared_ptr<crypto::PublicKey> Certificate::GetPublicKey() const {
    if (!cert_) throw CertificateError("certificate is null");
    return adoptPublicKey(X509_get_pubkey(cert_), "certificate");
}

bool Certificate::VerifySignature(const crypto::PublicKey& key) const {
    if (!cert_ || !key.GetEVPKey()) return false;
    return checkVerifyResult(X509_verify(cert_, key.GetEVPKey()));
}

// CertificateRequest类实现

CertificateRequest::CertificateRequest(X509_REQ* req) : req_(req) {}

CertificateRequest::~CertificateRequest() {
    if (req_) {
        X509_REQ_free(req_);
    }
}

CertificateRequest::CertificateRequest(CertificateRequest&& other) noexcept : req_(other.req_) {
    other.req_ = nullptr;
}

CertificateRequest& CertificateRequest::operator=(CertificateRequest&& other) noexcept {
    if (this != &other) {
        if (req_) {
            X509_REQ_free(req_);
        }
        req_ = other.req_;
        other.req_ = nullptr;
    }
    return *this;
}

std::string CertificateRequest::GetSubject() const {
    if (!req_) throw CertificateError("certificate request is null");
    return FormatName(X509_REQ_get_subject_name(req_));
}

std::shared_ptr<crypto::PublicKey> CertificateRequest::GetPublicKey() const {
    if (!req_) throw CertificateError("certificate request is null");
    return adoptPublicKey(X509_REQ_get_pubkey(req_), "certificate request");
}

bool CertificateRequest::VerifySignature(const crypto::PublicKey& key) const {
    if (!req_ || !key.GetEVPKey()) return false;
    return checkVerifyResult(X509_REQ_verify(req_, key.GetEVPKey()));
}

// RevocationList类实现

RevocationList::RevocationList(X509_CRL* crl) : crl_(crl) {}

RevocationList::~RevocationList() {
    if (crl_) {
        X509_CRL_free(crl_);
    }
}

RevocationList::RevocationList(RevocationList&& other) noexcept : crl_(other.crl_) {
    other.crl_ = nullptr;
}

RevocationList& RevocationList::operator=(RevocationList&& other) noexcept {
    if (this != &other) {
        if (crl_) {
            X509_CRL_free(crl_);
        }
        crl_ = other.crl_;
        other.crl_ = nullptr;
    }
    return *this;
}

std::string RevocationList::GetIssuer() const {
    if (!crl_) throw CertificateError("revocation list is null");
    return FormatName(X509_CRL_get_issuer(crl_));
}

std::vector<std::string> RevocationList::GetRevokedSerials() const {
    if (!crl_) throw CertificateError("revocation list is null");

    std::vector<std::string> serials;
    STACK_OF(X509_REVOKED)* revoked = X509_CRL_get_REVOKED(crl_);
    if (!revoked) {
        return serials;
    }

    for (int i = 0; i < sk_X509_REVOKED_num(revoked); ++i) {
        const X509_REVOKED* entry = sk_X509_REVOKED_value(revoked, i);
        serials.push_back(FormatSerial(X509_REVOKED_get0_serialNumber(entry)));
    }
    return serials;
}

bool RevocationList::VerifySignature(const crypto::PublicKey& key) const {
    if (!crl_ || !key.GetEVPKey()) return false;
    return checkVerifyResult(X509_CRL_verify(crl_, key.GetEVPKey()));
}

// PEM加载函数

Result<std::shared_ptr<Certificate>> LoadCertificateFromPEM(const std::string& pemData) {
    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) return Error("Failed to create memory BIO for certificate");

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        return Error("failed to parse certificate: " + crypto::DrainOpenSSLErrors());
    }
    return std::make_shared<Certificate>(cert);
}

Result<std::shared_ptr<CertificateRequest>> LoadCertificateRequestFromPEM(const std::string& pemData) {
    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) return Error("Failed to create memory BIO for certificate request");

    X509_REQ* req = PEM_read_bio_X509_REQ(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!req) {
        return Error("failed to parse certificate request: " + crypto::DrainOpenSSLErrors());
    }
    return std::make_shared<CertificateRequest>(req);
}

Result<std::shared_ptr<RevocationList>> LoadRevocationListFromPEM(const std::string& pemData) {
    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) return Error("Failed to create memory BIO for revocation list");

    X509_CRL* crl = PEM_read_bio_X509_CRL(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!crl) {
        return Error("failed to parse revocation list: " + crypto::DrainOpenSSLErrors());
    }
    return std::make_shared<RevocationList>(crl);
}

std::string FormatName(const X509_NAME* name) {
    if (!name) throw CertificateError("name is null");

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) throw CertificateError("Failed to create memory BIO for name");

    // RFC 2253 顺序，非ASCII字符按UTF-8输出而不转义
    unsigned long flags = XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB;
    if (X509_NAME_print_ex(bio, name, 0, flags) < 0) {
        BIO_free(bio);
        throw CertificateError("failed to print name: " + crypto::DrainOpenSSLErrors());
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result(data, len);
    BIO_free(bio);
    return result;
}

std::string FormatSerial(const ASN1_INTEGER* serial) {
    if (!serial) throw CertificateError("serial number is null");

    BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
    if (!bn) throw CertificateError("failed to convert serial number: " + crypto::DrainOpenSSLErrors());

    char* dec = BN_bn2dec(bn);
    BN_free(bn);
    if (!dec) throw CertificateError("failed to print serial number: " + crypto::DrainOpenSSLErrors());

    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

} // namespace utils
} // namespace certscan
