#include "scpsend/Progress.hpp"

#include <algorithm>
#include <limits>

namespace scpsend {

void ThroughputMeter::update(const ProgressSample &s) {
    using secs = std::chrono::duration<double>;
    const auto sinceTick = s.elapsed - lastTick_;
    if (sinceTick >= window_) {
        const double dt = std::chrono::duration_cast<secs>(sinceTick).count();
        const double delta =
            (s.bytes_sent > lastBytes_) ? double(s.bytes_sent - lastBytes_) : 0.0;
        if (dt > 0.000001)
            rate_ = delta / dt;
        lastTick_ = s.elapsed;
        lastBytes_ = s.bytes_sent;
        haveWindow_ = true;
    } else if (!haveWindow_) {
        rate_ = s.averageBytesPerSecond();
    }

    if (s.complete()) {
        eta_ = 0;
    } else if (rate_ > 0.0) {
        const double left = double(s.total_bytes - s.bytes_sent) / rate_;
        eta_ = int(std::min(left, double(std::numeric_limits<int>::max())));
    } else {
        eta_ = -1;
    }
}

} // namespace scpsend
