#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>

namespace Wake {

using Clock = std::chrono::steady_clock;

// One threshold crossing reported by the keyword producer
struct DetectionEvent {
    std::size_t keywordIndex = 0;   // index into the configured keyword list
    Clock::time_point timestamp;
};

// Shared "exit requested" signal, polled by both pipeline loops
extern std::atomic<bool> g_exitRequested;

void requestExit();
bool exitRequested();

} // namespace Wake
