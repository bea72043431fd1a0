#include "ParameterContext.hpp"
#include "WorkflowParser.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--workflow-file", 'f', "Workflow YAML file to execute", true},
    {"--config-file", 'c', "Runner config file path", true},
    {"--concurrency", 'j', "Number of job instances running at once", true},
    {"--secrets", 's', "Comma separated secret names to resolve", true},
    {"--vars", 'e', "Extra workflow env, e.g. \"K1=v1; K2=v2\"", true},
    {"--report", 'r', "Write a JSON run report to this path", true},
    {"--validate", 'n', "Parse and plan only, print the execution plan", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
    // Add more command options here
};

void ParameterContext::show_help() {
    std::cout << "Usage: flowexec [OPTIONS]... [WORKFLOW_FILE]\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  FLOWEXEC_CONCURRENCY, FLOWEXEC_LOG_DIR, FLOWEXEC_WORKDIR, FLOWEXEC_ARTIFACT_DIR\n"
              << "\nExit status:\n"
              << "  0 success, 1 failure or invalid input, 2 cancelled\n"
              << "\nExamples:\n"
              << "  flowexec --workflow-file=ci.yaml\n"
              << "  flowexec -f ci.yaml -c runner.yaml -j 4 -e \"TARGET=release; ARCH=x86_64\"\n"
              << "  flowexec -n ci.yaml\n\n";
}

void ParameterContext::show_version() {
    std::cout << "flowexec version: " << FLOWEXEC_VERSION << std::endl;
    std::cout << "git: " << FLOWEXEC_BUILD_GIT << std::endl;
    std::cout << "build: " << FLOWEXEC_BUILD_TARGET_OSTYPE << "-" << FLOWEXEC_BUILD_TARGET_CPUTYPE << " " << FLOWEXEC_BUILD_DATE << std::endl;
}

int ParameterContext::parse_concurrency(const std::string& value, const std::string& source) {
    int concurrency = 0;
    try {
        size_t consumed = 0;
        concurrency = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid concurrency from " + source + ": " + value);
    }
    if (concurrency < 1) {
        throw std::runtime_error("Concurrency from " + source + " must be at least 1: " + value);
    }
    return concurrency;
}

EnvMap ParameterContext::parse_vars(const std::string& text) {
    EnvMap vars;
    for (const auto& entry : StringUtils::split(text, ';')) {
        size_t pos = entry.find('=');
        if (pos == std::string::npos) continue;

        std::string key = StringUtils::trimmed(entry.substr(0, pos));
        std::string value = StringUtils::trimmed(entry.substr(pos + 1));
        if (key.empty()) continue;
        if (!StringUtils::is_identifier(key)) {
            throw std::runtime_error("Invalid variable name in --vars: " + key);
        }
        vars[key] = value;
    }
    return vars;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }
    if (!config.IsMap()) {
        throw std::runtime_error("Runner config must be a mapping");
    }

    static const std::set<std::string> valid_keys = YAML::merge_keys<std::string>({
        YAML::global_config_keys(), {"concurrency"}
    });
    YAML::check_unknown_keys(config, valid_keys, "runner config");

    // GlobalConfig decoding ignores the scheduler-level keys
    YAML::Node global = YAML::Clone(config);
    global.remove("concurrency");
    GlobalConfig decoded = config_data.global;
    YAML::convert<GlobalConfig>::decode(global, decoded);
    config_data.global = std::move(decoded);

    if (config["concurrency"]) {
        config_data.concurrency = parse_concurrency(config["concurrency"].as<std::string>(), "runner config");
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // A single positional argument names the workflow file
        else {
            if (cli_params.count("--workflow-file")) {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
            cli_params["--workflow-file"] = arg;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& global = config_data.global;

    if (cli_params.count("--workflow-file")) {
        global.workflow_file = cli_params["--workflow-file"];
    }

    if (cli_params.count("--concurrency")) {
        config_data.concurrency = parse_concurrency(cli_params["--concurrency"], "--concurrency");
    }

    if (cli_params.count("--secrets")) {
        for (const auto& name : StringUtils::split(cli_params["--secrets"], ',')) {
            std::string trimmed = StringUtils::trimmed(name);
            if (trimmed.empty()) continue;
            if (std::find(global.secrets.begin(), global.secrets.end(), trimmed) == global.secrets.end()) {
                global.secrets.push_back(trimmed);
            }
        }
    }

    if (cli_params.count("--vars")) {
        for (const auto& [key, value] : parse_vars(cli_params["--vars"])) {
            global.env[key] = value;
        }
    }

    if (cli_params.count("--report")) {
        global.report_file = cli_params["--report"];
    }

    if (cli_params.count("--validate")) {
        global.validate_only = true;
    }

    if (cli_params.count("--verbose")) {
        global.verbose = true;
    }
}

void ParameterContext::merge_environment_vars() {
    // Define environment variables to read
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"FLOWEXEC_CONCURRENCY", "concurrency"},
        {"FLOWEXEC_LOG_DIR", "log_dir"},
        {"FLOWEXEC_WORKDIR", "working_directory"},
        {"FLOWEXEC_ARTIFACT_DIR", "artifact_dir"}
    };

    auto& global = config_data.global;
    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value || *env_value == '\0') {
            continue;
        }
        if (key == "concurrency") {
            config_data.concurrency = parse_concurrency(env_value, env_var);
        } else if (key == "log_dir") {
            global.log_dir = env_value;
        } else if (key == "working_directory") {
            global.working_directory = env_value;
        } else if (key == "artifact_dir") {
            global.artifact_dir = env_value;
        }
    }
}

void ParameterContext::load_workflow() {
    const auto& file = config_data.global.workflow_file;
    if (file.empty()) {
        throw std::runtime_error("Missing required parameter: --workflow-file or -f");
    }
    config_data.workflow = WorkflowParser::parse_file(file);
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
    merge_environment_vars();
    merge_commandline();
    load_workflow();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const Workflow& ParameterContext::get_workflow() const {
    return config_data.workflow;
}
