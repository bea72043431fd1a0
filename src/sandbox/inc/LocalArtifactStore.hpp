#pragma once

#include "IArtifactStore.hpp"
#include <mutex>

// Artifacts kept as plain files below a root directory, one entry per key
class LocalArtifactStore : public IArtifactStore {
public:
    explicit LocalArtifactStore(std::filesystem::path root);

    void upload(const std::string& key, const std::filesystem::path& source) override;
    std::optional<std::filesystem::path> download(const std::string& key) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path entry_path(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};
