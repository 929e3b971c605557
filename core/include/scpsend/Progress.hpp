// Rate/ETA estimation over successive progress samples.
#pragma once
#include "SessionTypes.hpp"

#include <chrono>
#include <cstdint>

namespace scpsend {

// Instantaneous throughput measured over a sliding window of at least
// `window` between updates; falls back to the average until the first
// window has elapsed.
class ThroughputMeter {
public:
    explicit ThroughputMeter(std::chrono::milliseconds window = std::chrono::milliseconds(500))
        : window_(window) {}

    void update(const ProgressSample &s);

    // Bytes per second, 0 when unknown.
    double bytesPerSecond() const { return rate_; }
    // Seconds remaining, -1 when unknown, 0 when complete.
    int etaSeconds() const { return eta_; }

private:
    std::chrono::steady_clock::duration window_;
    std::chrono::steady_clock::duration lastTick_{};
    std::uint64_t lastBytes_ = 0;
    bool haveWindow_ = false;
    double rate_ = 0.0;
    int eta_ = -1;
};

} // namespace scpsend
