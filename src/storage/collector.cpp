#include "certscan/storage/collector.hpp"
#include "certscan/utils/logger.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace certscan {
namespace storage {

namespace fs = std::filesystem;

std::string ReadFileContents(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("cannot open file: " + path.string());
    }

    std::string data((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());

    if (file.bad()) {
        throw IOError("failed to read file: " + path.string());
    }
    return data;
}

void Collector::Collect(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        CollectPath(path);
    }
}

void Collector::CollectPath(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw IOError("cannot access " + path.string() + (ec ? ": " + ec.message() : ""));
    }

    if (fs::is_directory(status)) {
        collectDirectory(path);
    } else if (fs::is_regular_file(status)) {
        collectFile(path);
    } else {
        utils::GetLogger().Debug("Skipping non-regular file", utils::LogContext().With("path", path.string()));
    }
}

void Collector::collectDirectory(const fs::path& dir) {
    // directory_iterator 不会返回 "." 和 ".."，子目录递归展开
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IOError("cannot list directory " + dir.string() + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        CollectPath(it->path());
    }
    if (ec) {
        throw IOError("cannot list directory " + dir.string() + ": " + ec.message());
    }
}

void Collector::collectFile(const fs::path& path) {
    std::string contents = ReadFileContents(path);

    auto classified = Classify(contents);
    if (classified.ok()) {
        utils::GetLogger().Debug("Classified file", utils::LogContext()
            .With("path", path.string())
            .With("kind", ArtifactKind(classified.value())));
        artifacts_.emplace_back(path.string(), std::move(classified).value());
        return;
    }

    utils::GetLogger().Debug("Could not classify file", utils::LogContext()
        .With("path", path.string())
        .With("reason", classified.error().what()));

    if (!isIgnored(path)) {
        warnings_ << "WARNING: file " << path.string() << " could not be interpreted" << std::endl;
        ++warningCount_;
    }
}

bool Collector::isIgnored(const fs::path& path) const {
    return config_.ignoredFileNames.count(path.filename().string()) > 0;
}

} // namespace storage
} // namespace certscan
