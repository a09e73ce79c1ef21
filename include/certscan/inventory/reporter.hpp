#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "certscan/artifact.hpp"
#include "certscan/inventory/key_registry.hpp"
#include "certscan/storage/collector.hpp"
#include "certscan/types.hpp"

namespace certscan {
namespace inventory {

// 报告中的一条记录
struct ReportEntry {
    std::string description;
    std::string path;
};

// 生成对象的描述文本。证书、请求和CRL会通过注册表查找签名者
std::string Describe(const Artifact& artifact, const KeyRegistry& registry);

// 从所有对象的公钥构建注册表
KeyRegistry BuildRegistry(const storage::ArtifactList& artifacts);

// 构建注册表后描述每个对象，按描述文本排序（相同时按路径）
// 单个对象处理失败只记录错误日志并跳过该对象
std::vector<ReportEntry> BuildReport(const storage::ArtifactList& artifacts);

// 输出报告，每条记录格式为 "<path>:\n  <description>\n\n"
void PrintReport(const std::vector<ReportEntry>& entries, std::ostream& out);

// 完整的扫描流程: 收集 -> 构建注册表 -> 描述 -> 排序 -> 输出
// 警告和报告都写到out；I/O错误以IOError抛出，此时不会输出任何报告
void RunInventory(const std::vector<std::string>& paths, const ScanConfig& config, std::ostream& out);

} // namespace inventory
} // namespace certscan
