/**
 * @file transferrate.h
 * @brief Throughput and remaining-time estimation for a running transfer.
 */

#ifndef TRANSFERRATE_H
#define TRANSFERRATE_H

#include <QtGlobal>

/**
 * @brief Snapshot of transfer telemetry.
 *
 * Rates are measured over the bytes acknowledged since the current session
 * started, not since the upload was first created, so a resumed upload does
 * not report an inflated speed for the bytes it inherited.
 *
 * @par Example usage:
 * @code
 * TransferRate rate = TransferRate::compute(4194304, 8388608, 10485760, 2000);
 * double mbps = rate.megabytesPerSecond(); // ~2.1
 * double eta = rate.etaSeconds;            // ~1.0
 * @endcode
 */
struct TransferRate {
    double progress = 0.0;        ///< Fraction acknowledged, in [0,1]
    double bytesPerSecond = 0.0;  ///< Session throughput
    double etaSeconds = 0.0;      ///< Remaining time, 0 when unknown

    [[nodiscard]] double megabytesPerSecond() const { return bytesPerSecond / 1000000.0; }

    /**
     * @brief Computes telemetry for a transfer.
     * @param sessionBytes Bytes acknowledged since the session started.
     * @param acknowledged Total bytes acknowledged by the server.
     * @param total Total size of the file.
     * @param elapsedMs Wall-clock milliseconds since the session started.
     */
    [[nodiscard]] static TransferRate compute(qint64 sessionBytes, qint64 acknowledged,
                                              qint64 total, qint64 elapsedMs)
    {
        TransferRate rate;
        const qint64 safeTotal = qMax<qint64>(total, 1);
        rate.progress = qBound(0.0, static_cast<double>(acknowledged) / static_cast<double>(safeTotal), 1.0);

        if (elapsedMs > 0 && sessionBytes > 0) {
            rate.bytesPerSecond = static_cast<double>(sessionBytes) * 1000.0
                                  / static_cast<double>(elapsedMs);
        }

        const qint64 remaining = qMax<qint64>(total - acknowledged, 0);
        if (rate.bytesPerSecond > 0.0) {
            rate.etaSeconds = static_cast<double>(remaining) / rate.bytesPerSecond;
        }
        return rate;
    }
};

#endif // TRANSFERRATE_H
