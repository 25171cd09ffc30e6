#include "networkmonitor.h"
#include "../utils/logging.h"

#include <QDebug>

NetworkMonitor::NetworkMonitor(QObject *parent)
    : QObject(parent)
{
    if (!QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qInfo() << "NetworkMonitor: no reachability backend, assuming online";
        return;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    hasBackend_ = true;
    connected_ = isReachable(info->reachability());
    LOG_VERBOSE() << "NetworkMonitor: backend" << info->backendName()
                  << "initially" << (connected_ ? "online" : "offline");

    connect(info, &QNetworkInformation::reachabilityChanged,
            this, &NetworkMonitor::onReachabilityChanged);
}

bool NetworkMonitor::isReachable(QNetworkInformation::Reachability reachability)
{
    switch (reachability) {
    case QNetworkInformation::Reachability::Online:
    case QNetworkInformation::Reachability::Unknown:
        return true;
    case QNetworkInformation::Reachability::Disconnected:
    case QNetworkInformation::Reachability::Local:
    case QNetworkInformation::Reachability::Site:
        return false;
    }
    return true;
}

void NetworkMonitor::setConnected(bool connected)
{
    if (connected == connected_) {
        return;
    }
    connected_ = connected;
    qDebug() << "NetworkMonitor: network" << (connected_ ? "available" : "lost");
    emit connectivityChanged(connected_);
}

void NetworkMonitor::onReachabilityChanged(QNetworkInformation::Reachability reachability)
{
    setConnected(isReachable(reachability));
}
