#pragma once

#include <memory>
#include <string>
#include <variant>
#include "certscan/types.hpp"
#include "certscan/crypto/keys.hpp"
#include "certscan/utils/x509.hpp"

namespace certscan {

// 一个被识别的PEM文件。闭合的变体类型，用std::visit分派，
// 访问者缺少任何分支都会导致编译失败。
using Artifact = std::variant<
    std::shared_ptr<utils::Certificate>,
    std::shared_ptr<utils::CertificateRequest>,
    std::shared_ptr<utils::RevocationList>,
    std::shared_ptr<crypto::RSAKey>
>;

// 辅助类型，把多个lambda合并成一个访问者
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// 根据文件内容识别对象类型
// 只检查第一行的PEM头，优先级: X509 CRL > CERTIFICATE REQUEST > CERTIFICATE > RSA PRIVATE/PUBLIC KEY
// 返回值:
// - 识别成功时返回解析好的对象
// - 无法识别或解析失败时返回带原因的Error，不抛出异常
Result<Artifact> Classify(const std::string& contents);

// 对象类型的名称，用于日志
std::string ArtifactKind(const Artifact& artifact);

} // namespace certscan
