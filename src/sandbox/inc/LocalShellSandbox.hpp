#pragma once

#include "ISandbox.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>

// Runs commands as `<shell> -e -c <command>` in a child process group on this host.
// Output of both streams is split into lines and handed to the caller while the
// process runs. On timeout or cancellation the whole group gets SIGTERM, then
// SIGKILL once the grace period has passed.
class LocalShellSandbox : public ISandbox {
public:
    explicit LocalShellSandbox(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(2000));

    SandboxResult execute(const SandboxRequest& request,
                          const CancellationToken& token,
                          const LineHandler& on_line) override;

    // Number of process groups this sandbox has asked to terminate
    size_t termination_count() const { return termination_count_.load(); }

private:
    std::chrono::milliseconds kill_grace_;
    std::atomic<size_t> termination_count_{0};
};
