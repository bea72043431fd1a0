#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when --help or --version was handled and nothing should run
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void load_workflow();

    // "K1=v1; K2=v2" -> {K1: v1, K2: v2}; entries without '=' are ignored
    static EnvMap parse_vars(const std::string& text);

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const Workflow& get_workflow() const;

private:
    ConfigData config_data; // Top-level config data

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    static int parse_concurrency(const std::string& value, const std::string& source);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--workflow-file")
        char short_opt;          // Short option (e.g. 'f')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
