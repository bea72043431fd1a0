#include "SignalManager.hpp"
#include <atomic>
#include <set>

namespace SignalManager {

namespace {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

std::map<int, SignalCallbackList> callbacks;
std::set<int> interrupt_signals;
std::mutex cb_mutex;
std::atomic<int> delivered{0};
std::atomic<int> interrupts{0};

void install(int signum, void (*handler)(int)) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    // Blocking syscalls in the control loop resume after the handler
    action.sa_flags = SA_RESTART;
    sigaction(signum, &action, nullptr);
}

void signal_handler(int signum) {
    delivered.store(signum);

    // The containers are only modified while no handler is installed for their keys
    if (interrupt_signals.count(signum) != 0 && interrupts.fetch_add(1) > 0) {
        install(signum, SIG_DFL);
        std::raise(signum);
        return;
    }

    auto it = callbacks.find(signum);
    if (it == callbacks.end()) return;
    for (auto& cb : it->second.normal_callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        it->second.final_callback.value()(signum);
    }
}

}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    install(signum, SIG_DFL);
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        install(kv.first, signal_handler);
    }
}

void on_interrupt(SignalCallback cb) {
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        interrupt_signals.insert(SIGINT);
        interrupt_signals.insert(SIGTERM);
        interrupts.store(0);
    }
    register_signal(SIGINT, cb);
    register_signal(SIGTERM, std::move(cb));
    setup();
}

void reset() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        install(kv.first, SIG_DFL);
    }
    callbacks.clear();
    interrupt_signals.clear();
    delivered.store(0);
    interrupts.store(0);
}

int last_signal() {
    return delivered.load();
}

}
