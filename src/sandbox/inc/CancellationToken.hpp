#pragma once

#include <atomic>
#include <memory>

// Shared cancellation flag. Copies observe the same state; a child token is
// cancelled whenever any of its ancestors is.
class CancellationToken {
public:
    CancellationToken();

    CancellationToken child() const;

    void cancel();
    bool is_cancelled() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<const State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};
