// Cooperative cancellation flag shared between the interactive thread (which
// requests) and a worker (which checks at file and chunk boundaries).
#pragma once
#include <atomic>

namespace duopane {

class CancellationFlag {
public:
    void requestCancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace duopane
