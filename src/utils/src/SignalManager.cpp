#include "SignalManager.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::atomic<int> received{0};
static std::atomic<bool> installed{false};

static void signal_handler(int signum) {
    received.store(signum);

    auto it = callbacks.find(signum);
    if (it == callbacks.end()) {
        return;
    }
    for (auto& cb : it->second.normal_callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        (*it->second.final_callback)(signum);
    }
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    if (installed.load()) {
        throw std::logic_error("SignalManager: register_signal called after setup for signal " + std::to_string(signum));
    }
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    received.store(0);
    for (const auto& kv : callbacks) {
        struct sigaction action {};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (sigaction(kv.first, &action, nullptr) != 0) {
            throw std::runtime_error("SignalManager: failed to install handler for signal " + std::to_string(kv.first));
        }
    }
    installed.store(true);
}

int last_signal() {
    return received.load();
}

void reset() {
    for (const auto& kv : callbacks) {
        std::signal(kv.first, SIG_DFL);
    }
    callbacks.clear();
    installed.store(false);
}

}
