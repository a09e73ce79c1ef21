#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "certscan/artifact.hpp"
#include "certscan/types.hpp"

namespace certscan {
namespace storage {

// 路径与识别出的对象，按发现顺序排列
using ArtifactList = std::vector<std::pair<std::string, Artifact>>;

// 读取整个文件内容，无法读取时抛出IOError
std::string ReadFileContents(const std::filesystem::path& path);

// 遍历给定路径，识别每个普通文件并按发现顺序收集结果。
// 无法识别且文件名不在忽略列表中的文件会向warnings输出一行警告。
class Collector {
public:
    Collector(const ScanConfig& config, std::ostream& warnings = std::cout)
        : config_(config), warnings_(warnings) {}

    // 收集所有路径（文件或目录，目录会递归展开）
    // 路径不存在或文件无法读取时抛出IOError，已收集的结果保持不变
    void Collect(const std::vector<std::string>& paths);

    // 收集单个路径
    void CollectPath(const std::filesystem::path& path);

    const ArtifactList& Artifacts() const { return artifacts_; }

    // 已输出的警告数量
    size_t WarningCount() const { return warningCount_; }

private:
    void collectFile(const std::filesystem::path& path);
    void collectDirectory(const std::filesystem::path& dir);
    bool isIgnored(const std::filesystem::path& path) const;

    ScanConfig config_;
    std::ostream& warnings_;
    ArtifactList artifacts_;
    size_t warningCount_ = 0;
};

} // namespace storage
} // namespace certscan
