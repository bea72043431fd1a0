#pragma once
#include <functional>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <csignal>

namespace SignalManager {

// Callbacks run inside the signal handler: keep them to atomic stores
using SignalCallback = std::function<void(int)>;

void register_signal(int signum, SignalCallback cb, bool is_final = false);
void setup();

// SIGINT and SIGTERM run `cb` once; a second interrupt takes the default
// action, so a stuck shutdown can still be killed from the terminal
void on_interrupt(SignalCallback cb);

// Restore default dispositions and drop all callbacks
void reset();

// Last signal delivered through the handler, 0 if none
int last_signal();

}
