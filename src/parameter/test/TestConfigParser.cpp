#include <iostream>
#include <cassert>
#include <yaml-cpp/yaml.h>
#include "ConfigParser.hpp"

namespace {

bool decode_fails(const std::string& yaml, const std::string& fragment) {
    try {
        YAML::Load(yaml).as<GlobalConfig>();
    } catch (const YAML::Exception& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    } catch (const std::runtime_error& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

} // namespace

void test_GlobalConfig_defaults() {
    GlobalConfig global = YAML::Load("{}").as<GlobalConfig>();
    assert(!global.verbose);
    assert(global.log_dir == "log/");
    assert(global.working_directory == ".");
    assert(global.artifact_dir == ".flowexec/artifacts");
    assert(global.shell == "/bin/sh");
    assert(!global.fail_fast);
    assert(global.default_timeout == std::chrono::minutes(360));
    assert(global.secrets.empty());
    assert(global.env.empty());
    assert(!global.validate_only);
    std::cout << "test_GlobalConfig_defaults passed\n";
}

void test_GlobalConfig_decode() {
    std::string yaml = R"(
workflow_file: ci.yaml
fail_fast: true
default_timeout_minutes: 1.5
shell: /bin/bash
secrets:
  - API_KEY
  - DEPLOY_TOKEN
env:
  RUNNER_OS: Linux
  EMPTY: ""
report: /tmp/report.json
)";
    GlobalConfig global = YAML::Load(yaml).as<GlobalConfig>();
    assert(global.workflow_file == "ci.yaml");
    assert(global.fail_fast);
    assert(global.default_timeout == std::chrono::milliseconds(90000));
    assert(global.shell == "/bin/bash");
    assert(global.secrets.size() == 2);
    assert(global.secrets[1] == "DEPLOY_TOKEN");
    assert(global.env.at("RUNNER_OS") == "Linux");
    assert(global.env.at("EMPTY").empty());
    assert(global.report_file == "/tmp/report.json");
    std::cout << "test_GlobalConfig_decode passed\n";
}

void test_GlobalConfig_errors() {
    assert(decode_fails("threads: 4\n", "Unknown configuration key in runner config: threads"));
    assert(decode_fails("default_timeout_minutes: 0\n", "default_timeout_minutes must be positive"));
    assert(decode_fails("default_timeout_minutes: -1\n", "default_timeout_minutes must be positive"));
    assert(decode_fails("env:\n  1BAD: x\n", "Invalid environment variable name in runner config: 1BAD"));
    assert(decode_fails("- workflow_file\n", "must be a mapping"));
    // Type mismatches come from yaml-cpp
    assert(decode_fails("fail_fast: sometimes\n", ""));
    std::cout << "test_GlobalConfig_errors passed\n";
}

void test_merge_and_check_keys() {
    auto keys = YAML::merge_keys<std::string>({{"a", "b"}, {"b", "c"}});
    assert(keys.size() == 3);
    assert(keys.count("c") == 1);

    YAML::Node node = YAML::Load("a: 1\nc: 2\n");
    YAML::check_unknown_keys(node, keys, "test");

    bool threw = false;
    try {
        YAML::check_unknown_keys(YAML::Load("a: 1\nd: 2\n"), keys, "job");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "Unknown configuration key in job: d";
    }
    assert(threw);
    (void)threw;

    assert(YAML::global_config_keys().count("secrets_file") == 1);
    assert(YAML::global_config_keys().count("concurrency") == 0);
    std::cout << "test_merge_and_check_keys passed\n";
}

int main() {
    test_GlobalConfig_defaults();
    test_GlobalConfig_decode();
    test_GlobalConfig_errors();
    test_merge_and_check_keys();
    std::cout << "All ConfigParser tests passed.\n";
    return 0;
}
