#include "certscan/crypto/keys.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace certscan {
namespace crypto {

namespace {

// 不提供任何密码，避免OpenSSL在终端上提示输入
int noPassphraseCallback(char* /*buf*/, int /*size*/, int /*rwflag*/, void* /*userdata*/) {
    return 0;
}

// 将公钥编码为SubjectPublicKeyInfo PEM文本
std::string encodePublicKeyPEM(EVP_PKEY* pkey) {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        throw std::runtime_error("Failed to create memory BIO for public key");
    }

    if (PEM_write_bio_PUBKEY(bio, pkey) != 1) {
        BIO_free(bio);
        throw std::runtime_error("Failed to encode public key: " + DrainOpenSSLErrors());
    }

    char* pemData = nullptr;
    long pemLen = BIO_get_mem_data(bio, &pemData);
    std::string result(pemData, pemLen);
    BIO_free(bio);

    return result;
}

} // namespace

PublicKey::PublicKey(EVP_PKEY* pkey) : pkey_(pkey) {
    if (!pkey_) {
        throw std::runtime_error("public key is null");
    }
    try {
        canonical_ = encodePublicKeyPEM(pkey_);
    } catch (...) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
        throw;
    }
}

PublicKey::~PublicKey() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
    }
}

PublicKey::PublicKey(PublicKey&& other) noexcept
    : pkey_(other.pkey_), canonical_(std::move(other.canonical_)) {
    other.pkey_ = nullptr;
}

PublicKey& PublicKey::operator=(PublicKey&& other) noexcept {
    if (this != &other) {
        if (pkey_) {
            EVP_PKEY_free(pkey_);
        }
        pkey_ = other.pkey_;
        canonical_ = std::move(other.canonical_);
        other.pkey_ = nullptr;
    }
    return *this;
}

int PublicKey::Bits() const {
    return pkey_ ? EVP_PKEY_bits(pkey_) : 0;
}

std::shared_ptr<PublicKey> PublicKeyFromEVP(EVP_PKEY* pkey) {
    if (!pkey) {
        throw std::runtime_error("public key is null");
    }
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
        throw std::runtime_error("value was not an RSA key");
    }

    // 通过DER往返只保留公钥部分
    unsigned char* der = nullptr;
    int derLen = i2d_PUBKEY(pkey, &der);
    if (derLen <= 0) {
        throw std::runtime_error("Failed to encode public key: " + DrainOpenSSLErrors());
    }

    const unsigned char* p = der;
    EVP_PKEY* pub = d2i_PUBKEY(nullptr, &p, derLen);
    OPENSSL_free(der);
    if (!pub) {
        throw std::runtime_error("Failed to decode public key: " + DrainOpenSSLErrors());
    }

    return std::make_shared<PublicKey>(pub);
}

Result<std::shared_ptr<RSAKey>> ParseRSAPrivateKeyPEM(const std::string& pemData) {
    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) {
        return Error("Failed to create memory BIO for private key");
    }

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, noPassphraseCallback, nullptr);
    BIO_free(bio);
    if (!pkey) {
        return Error("failed to parse RSA private key: " + DrainOpenSSLErrors());
    }

    try {
        auto publicKey = PublicKeyFromEVP(pkey);
        EVP_PKEY_free(pkey);
        return std::make_shared<RSAKey>(true, publicKey);
    } catch (const std::exception& e) {
        EVP_PKEY_free(pkey);
        return Error(std::string("failed to derive RSA public key: ") + e.what());
    }
}

Result<std::shared_ptr<RSAKey>> ParseRSAPublicKeyPEM(const std::string& pemData) {
    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) {
        return Error("Failed to create memory BIO for public key");
    }

    RSA* rsa = PEM_read_bio_RSAPublicKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!rsa) {
        return Error("failed to parse RSA public key: " + DrainOpenSSLErrors());
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (!pkey || EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
        RSA_free(rsa);
        if (pkey) EVP_PKEY_free(pkey);
        return Error("failed to wrap RSA public key: " + DrainOpenSSLErrors());
    }

    try {
        return std::make_shared<RSAKey>(false, std::make_shared<PublicKey>(pkey));
    } catch (const std::exception& e) {
        return Error(std::string("failed to encode RSA public key: ") + e.what());
    }
}

std::string DrainOpenSSLErrors() {
    std::string result;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

} // namespace crypto
} // namespace certscan
