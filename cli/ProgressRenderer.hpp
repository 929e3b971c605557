// Single-line terminal progress bar fed by the transfer engine.
#pragma once
#include "scpsend/Progress.hpp"
#include "scpsend/SessionTypes.hpp"

#include <QString>
#include <chrono>
#include <cstdio>

namespace scpsendcli {

// "01:02:03", "--:--" when unknown.
QString formatEta(int seconds);
QString formatBytes(quint64 bytes);

// [#####>----] 1.2 MiB/3.0 MiB  40%  512.0 KiB/s  ETA 00:04
QString renderProgressLine(const scpsend::ProgressSample &s, double bytesPerSec,
                           int etaSeconds, int barWidth = 30);

class ProgressRenderer {
public:
    explicit ProgressRenderer(std::FILE *out = stderr,
                              std::chrono::milliseconds minInterval = std::chrono::milliseconds(100));

    // Called by the engine after each chunk: redraws at most once per
    // interval, always for the final sample.
    void report(const scpsend::ProgressSample &s);
    // Terminates the line.
    void finish();

private:
    std::FILE *out_;
    std::chrono::steady_clock::duration minInterval_;
    std::chrono::steady_clock::duration lastDraw_{};
    bool drawn_ = false;
    scpsend::ThroughputMeter meter_;
};

} // namespace scpsendcli
