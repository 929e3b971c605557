#include "ProgressRenderer.hpp"

#include <QLocale>

namespace scpsendcli {

QString formatEta(int seconds) {
    if (seconds < 0)
        return QStringLiteral("--:--");
    const int h = seconds / 3600;
    const int m = (seconds / 60) % 60;
    const int s = seconds % 60;
    if (h > 0)
        return QStringLiteral("%1:%2:%3")
            .arg(h, 2, 10, QChar('0'))
            .arg(m, 2, 10, QChar('0'))
            .arg(s, 2, 10, QChar('0'));
    return QStringLiteral("%1:%2").arg(m, 2, 10, QChar('0')).arg(s, 2, 10, QChar('0'));
}

QString formatBytes(quint64 bytes) {
    return QLocale::c().formattedDataSize(static_cast<qint64>(bytes), 1,
                                          QLocale::DataSizeIecFormat);
}

QString renderProgressLine(const scpsend::ProgressSample &s, double bytesPerSec,
                           int etaSeconds, int barWidth) {
    const double frac = s.fraction();
    const int filled = int(frac * barWidth);
    QString bar;
    bar.reserve(barWidth);
    for (int i = 0; i < barWidth; ++i) {
        if (i < filled)
            bar += QChar('#');
        else if (i == filled)
            bar += QChar('>');
        else
            bar += QChar('-');
    }
    return QStringLiteral("[%1] %2/%3 %4% %5/s ETA %6")
        .arg(bar,
             formatBytes(s.bytes_sent),
             formatBytes(s.total_bytes))
        .arg(int(frac * 100), 3)
        .arg(formatBytes(quint64(bytesPerSec)), formatEta(etaSeconds));
}

ProgressRenderer::ProgressRenderer(std::FILE *out, std::chrono::milliseconds minInterval)
    : out_(out), minInterval_(minInterval) {}

void ProgressRenderer::report(const scpsend::ProgressSample &s) {
    meter_.update(s);
    if (drawn_ && !s.complete() && s.elapsed - lastDraw_ < minInterval_)
        return;
    lastDraw_ = s.elapsed;
    drawn_ = true;
    const QByteArray line =
        renderProgressLine(s, meter_.bytesPerSecond(), meter_.etaSeconds()).toLocal8Bit();
    std::fputc('\r', out_);
    std::fwrite(line.constData(), 1, static_cast<std::size_t>(line.size()), out_);
    std::fflush(out_);
}

void ProgressRenderer::finish() {
    if (drawn_) {
        std::fputc('\n', out_);
        std::fflush(out_);
    }
}

} // namespace scpsendcli
