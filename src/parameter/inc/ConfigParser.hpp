#pragma once

#include "GlobalConfig.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"

#include <initializer_list>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>


namespace YAML {

    template<typename T>
    std::set<T> merge_keys(const std::initializer_list<std::set<T>>& sets) {
        std::set<T> result;
        for (const auto& s : sets) {
            result.insert(s.begin(), s.end());
        }
        return result;
    }

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    // Runner config keys that land in GlobalConfig
    inline const std::set<std::string>& global_config_keys() {
        static const std::set<std::string> keys = {
            "workflow_file", "fail_fast", "default_timeout_minutes", "log_dir",
            "working_directory", "artifact_dir", "shell", "secrets", "secrets_file",
            "env", "report", "verbose"
        };
        return keys;
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("Runner config must be a mapping");
            }
            check_unknown_keys(node, global_config_keys(), "runner config");

            if (node["workflow_file"]) {
                rhs.workflow_file = node["workflow_file"].as<std::string>();
            }
            if (node["fail_fast"]) {
                rhs.fail_fast = node["fail_fast"].as<bool>();
            }
            if (node["default_timeout_minutes"]) {
                auto timeout = TimestampUtils::minutes_to_duration(node["default_timeout_minutes"].as<double>());
                if (!timeout) {
                    throw std::runtime_error("default_timeout_minutes must be positive");
                }
                rhs.default_timeout = *timeout;
            }
            if (node["log_dir"]) {
                rhs.log_dir = node["log_dir"].as<std::string>();
            }
            if (node["working_directory"]) {
                rhs.working_directory = node["working_directory"].as<std::string>();
            }
            if (node["artifact_dir"]) {
                rhs.artifact_dir = node["artifact_dir"].as<std::string>();
            }
            if (node["shell"]) {
                rhs.shell = node["shell"].as<std::string>();
            }
            if (node["secrets"]) {
                rhs.secrets = node["secrets"].as<std::vector<std::string>>();
            }
            if (node["secrets_file"]) {
                rhs.secrets_file = node["secrets_file"].as<std::string>();
            }
            if (node["env"]) {
                for (auto it = node["env"].begin(); it != node["env"].end(); ++it) {
                    std::string key = it->first.as<std::string>();
                    if (!StringUtils::is_identifier(key)) {
                        throw std::runtime_error("Invalid environment variable name in runner config: " + key);
                    }
                    rhs.env[key] = it->second.as<std::string>();
                }
            }
            if (node["report"]) {
                rhs.report_file = node["report"].as<std::string>();
            }
            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            return true;
        }
    };
}
