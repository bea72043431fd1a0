#include "LocalArtifactStore.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

LocalArtifactStore::LocalArtifactStore(fs::path root) : root_(std::move(root)) {}

fs::path LocalArtifactStore::entry_path(const std::string& key) const {
    if (key.empty() || key == "." || key == ".." ||
        key.find('/') != std::string::npos || key.find('\\') != std::string::npos) {
        throw std::runtime_error("Invalid artifact name: '" + key + "'");
    }
    return root_ / key;
}

void LocalArtifactStore::upload(const std::string& key, const fs::path& source) {
    const fs::path target = entry_path(key);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        throw std::runtime_error("Artifact source does not exist: " + source.string());
    }

    fs::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create artifact directory " + root_.string() + ": " + ec.message());
    }

    fs::remove_all(target, ec);
    if (fs::is_directory(source)) {
        fs::copy(source, target, fs::copy_options::recursive, ec);
    } else {
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to store artifact '" + key + "': " + ec.message());
    }
    LogUtils::debug("Stored artifact '{}' from {}", key, source.string());
}

std::optional<fs::path> LocalArtifactStore::download(const std::string& key) const {
    const fs::path target = entry_path(key);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(target, ec)) return std::nullopt;
    return target;
}
