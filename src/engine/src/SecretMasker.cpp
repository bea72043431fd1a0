#include "SecretMasker.hpp"
#include "StringUtils.hpp"

void SecretMasker::add(const std::string& secret) {
    if (secret.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.insert(secret);
}

std::string SecretMasker::mask(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string result = text;
    for (const auto& secret : secrets_) {
        result = StringUtils::replace_all(result, secret, MASK);
    }
    return result;
}

size_t SecretMasker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secrets_.size();
}
