/**
 * @file ihttptransport.h
 * @brief Interface for asynchronous HTTP transports.
 *
 * This interface allows dependency injection of the network layer, enabling
 * runtime swapping between the QNetworkAccessManager implementation and a
 * scripted mock for testing.
 */

#ifndef IHTTPTRANSPORT_H
#define IHTTPTRANSPORT_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPair>
#include <QString>
#include <QUrl>

/**
 * @brief A single outgoing HTTP request.
 */
struct HttpRequest {
    QByteArray method;                               ///< "GET", "POST", "HEAD", "PATCH", ...
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;    ///< Sent in order
    QByteArray body;

    void setHeader(const QByteArray &name, const QByteArray &value);
    [[nodiscard]] QByteArray header(const QByteArray &name) const;
};

/**
 * @brief Transport-level failure classes.
 *
 * NetworkLost covers every error that means "the route is gone" (refused,
 * reset, unreachable host, timeout, temporary network failure). Those are
 * handled as a pause rather than a failure by the upload engine.
 */
enum class HttpError {
    None,         ///< A response was received (any status code)
    NetworkLost,  ///< Connectivity-class error
    Aborted,      ///< Request was aborted locally
    Other         ///< TLS, protocol or other non-transient error
};

/**
 * @brief Result of an HTTP request.
 */
struct HttpResponse {
    HttpError error = HttpError::None;
    int statusCode = 0;
    QHash<QByteArray, QByteArray> headers;  ///< Keys are lower-case
    QByteArray body;
    QString errorString;

    [[nodiscard]] bool hasResponse() const { return error == HttpError::None; }
    [[nodiscard]] bool isSuccess() const { return hasResponse() && statusCode >= 200 && statusCode < 300; }
    [[nodiscard]] bool isNetworkLoss() const { return error == HttpError::NetworkLost; }

    /// Case-insensitive header lookup
    [[nodiscard]] QByteArray header(const QByteArray &name) const { return headers.value(name.toLower()); }
    [[nodiscard]] bool hasHeader(const QByteArray &name) const { return headers.contains(name.toLower()); }
    void setHeader(const QByteArray &name, const QByteArray &value) { headers.insert(name.toLower(), value); }
};

Q_DECLARE_METATYPE(HttpResponse)

/**
 * @brief Abstract interface for HTTP transports.
 *
 * Requests are identified by the id returned from send(); completion is
 * reported through finished() on the owner's thread. Every request emits
 * finished() exactly once unless it is aborted with abort(), in which case
 * nothing is emitted for it.
 *
 * @par Example usage:
 * @code
 * IHttpTransport *http = new NetworkHttpTransport(this);
 *
 * HttpRequest req;
 * req.method = "HEAD";
 * req.url = uploadUrl;
 * quint64 id = http->send(req);
 *
 * connect(http, &IHttpTransport::finished, this,
 *         [id](quint64 requestId, const HttpResponse &response) {
 *     if (requestId == id) { ... }
 * });
 * @endcode
 */
class IHttpTransport : public QObject
{
    Q_OBJECT

public:
    explicit IHttpTransport(QObject *parent = nullptr) : QObject(parent) {}
    ~IHttpTransport() override = default;

    /**
     * @brief Starts a request.
     * @return Non-zero request id used to correlate finished().
     */
    virtual quint64 send(const HttpRequest &request) = 0;

    /**
     * @brief Aborts an in-flight request; finished() is not emitted for it.
     * @param requestId Id returned by send(); unknown ids are ignored.
     */
    virtual void abort(quint64 requestId) = 0;

signals:
    /**
     * @brief Emitted when a request completes or fails.
     * @param requestId The id returned by send().
     * @param response Status, headers and body, or the transport error.
     */
    void finished(quint64 requestId, const HttpResponse &response);
};

#endif // IHTTPTRANSPORT_H
