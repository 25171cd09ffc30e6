/**
 * @file networkhttptransport.h
 * @brief QNetworkAccessManager-backed HTTP transport.
 */

#ifndef NETWORKHTTPTRANSPORT_H
#define NETWORKHTTPTRANSPORT_H

#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>

#include "ihttptransport.h"

/**
 * @brief Production transport using QNetworkAccessManager.
 *
 * All requests are non-blocking; replies are delivered on the thread that
 * owns this object. A request that transfers no data for TransferTimeoutMs
 * is aborted by Qt and reported as HttpError::NetworkLost.
 */
class NetworkHttpTransport : public IHttpTransport
{
    Q_OBJECT

public:
    /// Inactivity timeout per request in milliseconds
    static constexpr int TransferTimeoutMs = 60000;

    explicit NetworkHttpTransport(QObject *parent = nullptr);
    ~NetworkHttpTransport() override;

    quint64 send(const HttpRequest &request) override;
    void abort(quint64 requestId) override;

    /// Maps a QNetworkReply error to the transport error classes
    [[nodiscard]] static HttpError classifyError(QNetworkReply::NetworkError error);

private slots:
    void onReplyFinished(QNetworkReply *reply);

private:
    QNetworkAccessManager *networkManager_ = nullptr;
    QHash<QNetworkReply*, quint64> pendingRequests_;
    quint64 nextRequestId_ = 1;
};

#endif // NETWORKHTTPTRANSPORT_H
