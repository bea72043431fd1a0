#include "ScopedEnvVar.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

std::string env_name(const std::string& base) {
    return "FLOWEXEC_TEST_" + base + "_" + std::to_string(getpid());
}

bool is_set(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}

std::string value_of(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? value : "";
}

} // namespace

void test_empty_name_rejected() {
    bool threw = false;
    try {
        ScopedEnvVar env("", std::string("x"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
    std::cout << "test_empty_name_rejected passed.\n";
}

void test_override_is_scoped() {
    const std::string name = env_name("CONCURRENCY");
    setenv(name.c_str(), "2", 1);
    {
        ScopedEnvVar env(name, std::string("8"));
        assert(value_of(name) == "8");
    }
    assert(value_of(name) == "2");

    unsetenv(name.c_str());
    {
        ScopedEnvVar env(name, std::string("8"));
        assert(value_of(name) == "8");
    }
    assert(!is_set(name));
    std::cout << "test_override_is_scoped passed.\n";
}

void test_unset_is_scoped() {
    const std::string name = env_name("LOG_DIR");
    setenv(name.c_str(), "/tmp/logs", 1);
    {
        ScopedEnvVar env(name, std::nullopt);
        assert(!is_set(name));
    }
    assert(value_of(name) == "/tmp/logs");
    unsetenv(name.c_str());
    std::cout << "test_unset_is_scoped passed.\n";
}

void test_early_restore() {
    const std::string name = env_name("WORKDIR");
    unsetenv(name.c_str());
    {
        ScopedEnvVar env(name, std::string("/src"));
        env.restore();
        assert(!is_set(name));
    }
    assert(!is_set(name));
    std::cout << "test_early_restore passed.\n";
}

void test_snapshot() {
    const std::string name = env_name("SNAPSHOT");
    {
        ScopedEnvVar env(name, std::string("a=b=c"));
        auto env_map = ScopedEnvVar::snapshot();
        assert(env_map.count(name) == 1);
        // Only the first '=' separates name and value
        assert(env_map[name] == "a=b=c");
    }
    assert(ScopedEnvVar::snapshot().count(name) == 0);
    std::cout << "test_snapshot passed.\n";
}

int main() {
    test_empty_name_rejected();
    test_override_is_scoped();
    test_unset_is_scoped();
    test_early_restore();
    test_snapshot();
    std::cout << "All ScopedEnvVar tests passed.\n";
    return 0;
}
