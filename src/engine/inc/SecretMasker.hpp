#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

// Replaces every registered secret value in text by a fixed mask. Values can be
// added while the run is in progress (::add-mask::), from any thread.
class SecretMasker {
public:
    static constexpr const char* MASK = "***";

    // Empty values are ignored
    void add(const std::string& secret);

    std::string mask(const std::string& text) const;

    size_t size() const;

private:
    struct LongestFirst {
        bool operator()(const std::string& a, const std::string& b) const {
            return a.size() != b.size() ? a.size() > b.size() : a < b;
        }
    };

    mutable std::mutex mutex_;
    std::set<std::string, LongestFirst> secrets_;
};
