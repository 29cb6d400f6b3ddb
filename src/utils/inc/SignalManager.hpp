#pragma once
#include <functional>
#include <csignal>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Normal callbacks run in registration order, the final callback (at most one
// per signal) runs last. Callbacks run inside the signal handler, so they
// must only touch lock-free state such as an atomic flag.
void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Installs the handler for every signal registered so far. Registering
// after setup() is not supported.
void setup();

// Last signal delivered since setup(), 0 when none
int last_signal();

// Drops all callbacks and restores the default disposition
void reset();

}
