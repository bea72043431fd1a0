#include "ISecretProvider.hpp"
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

std::optional<std::string> EnvSecretProvider::resolve(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::optional<std::string> MapSecretProvider::resolve(const std::string& name) const {
    auto it = secrets_.find(name);
    if (it == secrets_.end()) return std::nullopt;
    return it->second;
}

MapSecretProvider MapSecretProvider::from_yaml_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load secrets file " + path + ": " + e.what());
    }

    MapSecretProvider provider;
    if (!root || root.IsNull()) return provider;
    if (!root.IsMap()) {
        throw std::runtime_error("Secrets file " + path + " must contain a mapping of name: value");
    }
    for (const auto& item : root) {
        if (!item.second.IsScalar()) {
            throw std::runtime_error("Secret '" + item.first.as<std::string>() + "' in " + path + " must be a scalar");
        }
        provider.set(item.first.as<std::string>(), item.second.as<std::string>());
    }
    return provider;
}

std::optional<std::string> ChainedSecretProvider::resolve(const std::string& name) const {
    for (const auto* provider : providers_) {
        if (auto value = provider->resolve(name)) return value;
    }
    return std::nullopt;
}
