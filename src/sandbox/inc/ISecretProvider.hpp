#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

class ISecretProvider {
public:
    virtual ~ISecretProvider() = default;

    // Opaque secret value, std::nullopt when the name is unknown
    virtual std::optional<std::string> resolve(const std::string& name) const = 0;
};

// Secrets taken from the process environment under the same name
class EnvSecretProvider : public ISecretProvider {
public:
    std::optional<std::string> resolve(const std::string& name) const override;
};

// Secrets from a fixed name -> value table
class MapSecretProvider : public ISecretProvider {
public:
    MapSecretProvider() = default;
    explicit MapSecretProvider(std::map<std::string, std::string> secrets) : secrets_(std::move(secrets)) {}

    // Flat YAML mapping of name: value. Throws std::runtime_error when the file
    // cannot be read or is not a mapping of scalars.
    static MapSecretProvider from_yaml_file(const std::string& path);

    void set(const std::string& name, const std::string& value) { secrets_[name] = value; }

    std::optional<std::string> resolve(const std::string& name) const override;

private:
    std::map<std::string, std::string> secrets_;
};

// Tries each provider in order
class ChainedSecretProvider : public ISecretProvider {
public:
    void add(const ISecretProvider* provider) { providers_.push_back(provider); }

    std::optional<std::string> resolve(const std::string& name) const override;

private:
    std::vector<const ISecretProvider*> providers_;
};
