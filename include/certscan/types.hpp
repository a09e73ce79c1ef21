#pragma once

#include <string>
#include <vector>
#include <set>
#include <stdexcept>

namespace certscan {

// 识别的PEM头标记
const std::string PEM_CRL_MARKER             = "BEGIN X509 CRL";
const std::string PEM_REQUEST_MARKER         = "BEGIN CERTIFICATE REQUEST";
const std::string PEM_CERTIFICATE_MARKER     = "BEGIN CERTIFICATE";
const std::string PEM_RSA_PRIVATE_KEY_MARKER = "BEGIN RSA PRIVATE KEY";
const std::string PEM_RSA_PUBLIC_KEY_MARKER  = "BEGIN RSA PUBLIC KEY";

// 无法确定签名者时的显示值
const std::string UNKNOWN_SIGNER = "???";

// 错误类型
class Error {
public:
    explicit Error(const std::string& message) : message_(message), isError_(true) {}
    Error() : isError_(false) {}

    const std::string& what() const { return message_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }

private:
    std::string message_;
    bool isError_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

// 文件读取失败等I/O错误，终止整个扫描
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& message)
        : std::runtime_error("I/O error: " + message) {}
};

// 命名优先级，数值越小优先级越高
enum class NamePriority : int {
    CertificateSubject = 0,
    RequestSubject     = 1,
    PrivateKeyFile     = 2,
    PublicKeyFile      = 3
};

// 单次运行的配置
struct ScanConfig {
    // 不是密码学对象、也不需要警告的文件名
    std::set<std::string> ignoredFileNames = {
        "inventory.txt",
        "ca.pass",
        "serial",
        "serial.old",
        "index.txt",
        "index.txt.attr",
        "index.txt.old",
        "index.txt.attr.old",
        "crlnumber",
        "crlnumber.old"
    };
    std::string logLevel = "warn";
    std::string logFormat = "text";
};

} // namespace certscan
