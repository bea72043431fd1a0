#include "CancellationToken.hpp"

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancellationToken CancellationToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

void CancellationToken::cancel() {
    state_->cancelled.store(true, std::memory_order_release);
}

bool CancellationToken::is_cancelled() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) return true;
    }
    return false;
}
