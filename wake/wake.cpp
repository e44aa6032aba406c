#include "wake.hpp"

namespace Wake {
    std::atomic<bool> g_exitRequested{false};

    // Also called from the signal handler; only touches the atomic
    void requestExit() {
        g_exitRequested.store(true);
    }

    bool exitRequested() {
        return g_exitRequested.load();
    }
}
