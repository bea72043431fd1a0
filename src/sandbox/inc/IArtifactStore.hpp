#pragma once

#include <filesystem>
#include <optional>
#include <string>

class IArtifactStore {
public:
    virtual ~IArtifactStore() = default;

    // Store a file or directory under key, replacing earlier content.
    // Throws std::runtime_error on failure.
    virtual void upload(const std::string& key, const std::filesystem::path& source) = 0;

    // Location of the stored content, std::nullopt when key was never uploaded
    virtual std::optional<std::filesystem::path> download(const std::string& key) const = 0;
};
