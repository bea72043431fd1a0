#pragma once

#include "ISandbox.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Test double interpreting a tiny command language, one command per line:
//   echo <text>     emit <text> on stdout
//   sleep <ms>      wait, honouring cancellation and timeout
//   exit <code>     stop with exit code
//   env <NAME>      emit NAME=<value of NAME in the request env>
// Records every request it receives.
class DummySandbox : public ISandbox {
public:
    SandboxResult execute(const SandboxRequest& request,
                          const CancellationToken& token,
                          const LineHandler& on_line) override {
        int now_running = ++running_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            max_running_ = std::max(max_running_, now_running);
        }

        SandboxResult result;
        result.exit_code = 0;
        const auto started = std::chrono::steady_clock::now();

        for (const auto& raw : StringUtils::split(request.command, '\n')) {
            std::string line = StringUtils::trimmed(raw);
            if (line.empty()) continue;

            std::string verb = line.substr(0, line.find(' '));
            std::string arg = line.find(' ') == std::string::npos ? "" : line.substr(line.find(' ') + 1);

            if (verb == "echo") {
                on_line(OutputStream::Stdout, arg);
            } else if (verb == "env") {
                auto it = request.env.find(arg);
                on_line(OutputStream::Stdout, arg + "=" + (it == request.env.end() ? "" : it->second));
            } else if (verb == "exit") {
                result.exit_code = std::stoi(arg);
                break;
            } else if (verb == "sleep") {
                const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::stol(arg));
                while (std::chrono::steady_clock::now() < until) {
                    if (token.is_cancelled()) {
                        result.cancelled = true;
                        break;
                    }
                    if (request.timeout && std::chrono::steady_clock::now() - started >= *request.timeout) {
                        result.timed_out = true;
                        break;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                if (result.cancelled || result.timed_out) {
                    ++terminations_;
                    result.exit_code = 143;
                    break;
                }
            } else {
                on_line(OutputStream::Stderr, "unknown command: " + verb);
                result.exit_code = 127;
                break;
            }
        }

        --running_;
        return result;
    }

    std::vector<SandboxRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t execution_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    size_t termination_count() const { return terminations_.load(); }

    int max_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_running_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<SandboxRequest> requests_;
    std::atomic<int> running_{0};
    int max_running_ = 0;
    std::atomic<size_t> terminations_{0};
};
