#pragma once

#include <atomic>

// Set from a signal handler, polled by the run loop and the synchronizer.
class CancellationFlag {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
