/**
 * @file networkmonitor.h
 * @brief Watches OS network reachability.
 */

#ifndef NETWORKMONITOR_H
#define NETWORKMONITOR_H

#include <QNetworkInformation>
#include <QObject>

/**
 * @brief Reports whether the internet is reachable.
 *
 * Backed by QNetworkInformation when the platform provides a reachability
 * backend. Without one the monitor assumes the network is up and only
 * changes state through setConnected().
 *
 * @par Example usage:
 * @code
 * NetworkMonitor *monitor = new NetworkMonitor(this);
 * connect(monitor, &NetworkMonitor::connectivityChanged,
 *         queue, &UploadQueue::onConnectivityChanged);
 * @endcode
 */
class NetworkMonitor : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool connected READ isConnected NOTIFY connectivityChanged)

public:
    explicit NetworkMonitor(QObject *parent = nullptr);
    ~NetworkMonitor() override = default;

    [[nodiscard]] bool isConnected() const { return connected_; }

    /// True when an OS reachability backend was loaded
    [[nodiscard]] bool hasBackend() const { return hasBackend_; }

    /// Maps a QNetworkInformation reachability to "internet usable"
    [[nodiscard]] static bool isReachable(QNetworkInformation::Reachability reachability);

public slots:
    /**
     * @brief Overrides the connectivity state.
     *
     * Emits connectivityChanged() only when the state actually changes.
     */
    void setConnected(bool connected);

signals:
    /**
     * @brief Emitted when reachability flips.
     * @param connected True when the network came back.
     */
    void connectivityChanged(bool connected);

private slots:
    void onReachabilityChanged(QNetworkInformation::Reachability reachability);

private:
    bool connected_ = true;
    bool hasBackend_ = false;
};

#endif // NETWORKMONITOR_H
