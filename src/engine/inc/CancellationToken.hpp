#pragma once

#include <atomic>

// Set out-of-band (signal handler, host thread), checked by the runner before
// each step
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    void reset() noexcept { cancelled_.store(false); }
    bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
