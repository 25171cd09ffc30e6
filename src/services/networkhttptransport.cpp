#include "networkhttptransport.h"
#include "../utils/logging.h"

#include <QNetworkRequest>

NetworkHttpTransport::NetworkHttpTransport(QObject *parent)
    : IHttpTransport(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
    connect(networkManager_, &QNetworkAccessManager::finished,
            this, &NetworkHttpTransport::onReplyFinished);
}

NetworkHttpTransport::~NetworkHttpTransport()
{
    // Replies still in flight are children of the manager; drop them without
    // emitting finished() into a half-destroyed owner.
    const auto replies = pendingRequests_.keys();
    pendingRequests_.clear();
    for (QNetworkReply *reply : replies) {
        reply->abort();
    }
}

quint64 NetworkHttpTransport::send(const HttpRequest &request)
{
    QNetworkRequest req(request.url);
    for (const auto &header : request.headers) {
        req.setRawHeader(header.first, header.second);
    }
    req.setTransferTimeout(TransferTimeoutMs);

    QNetworkReply *reply = nullptr;
    if (request.method == "GET") {
        reply = networkManager_->get(req);
    } else if (request.method == "HEAD") {
        reply = networkManager_->head(req);
    } else if (request.method == "POST") {
        reply = networkManager_->post(req, request.body);
    } else if (request.method == "PUT") {
        reply = networkManager_->put(req, request.body);
    } else if (request.method == "DELETE") {
        reply = networkManager_->deleteResource(req);
    } else {
        reply = networkManager_->sendCustomRequest(req, request.method, request.body);
    }

    const quint64 id = nextRequestId_++;
    pendingRequests_.insert(reply, id);

    LOG_VERBOSE() << "HTTP:" << request.method << request.url.toString()
                  << "id" << id << "body" << request.body.size() << "bytes";
    return id;
}

void NetworkHttpTransport::abort(quint64 requestId)
{
    for (auto it = pendingRequests_.begin(); it != pendingRequests_.end(); ++it) {
        if (it.value() == requestId) {
            QNetworkReply *reply = it.key();
            pendingRequests_.erase(it);
            LOG_VERBOSE() << "HTTP: aborting request" << requestId;
            reply->abort();
            return;
        }
    }
}

HttpError NetworkHttpTransport::classifyError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::NoError:
        return HttpError::None;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
        return HttpError::NetworkLost;
    case QNetworkReply::OperationCanceledError:
        return HttpError::Aborted;
    default:
        return HttpError::Other;
    }
}

void NetworkHttpTransport::onReplyFinished(QNetworkReply *reply)
{
    reply->deleteLater();

    if (!pendingRequests_.contains(reply)) {
        return;  // Aborted by the caller
    }
    const quint64 id = pendingRequests_.take(reply);

    HttpResponse response;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    if (status.isValid()) {
        // HTTP-level errors (4xx/5xx) are still responses for the protocol layer
        response.statusCode = status.toInt();
        const auto pairs = reply->rawHeaderPairs();
        for (const auto &pair : pairs) {
            response.headers.insert(pair.first.toLower(), pair.second);
        }
        response.body = reply->readAll();
    } else {
        response.error = classifyError(reply->error());
        // Not requested by us, so Qt's transfer timeout fired
        if (response.error == HttpError::Aborted) {
            response.error = HttpError::NetworkLost;
        }
        if (response.error == HttpError::None) {
            response.error = HttpError::Other;
        }
        response.errorString = reply->errorString();
    }

    LOG_VERBOSE() << "HTTP: request" << id << "finished, status" << response.statusCode
                  << "error" << static_cast<int>(response.error) << response.errorString;

    emit finished(id, response);
}
