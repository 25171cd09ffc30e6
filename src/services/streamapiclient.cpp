#include "streamapiclient.h"
#include "../utils/jsonfields.h"
#include "../utils/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>

StreamApiClient::StreamApiClient(IHttpTransport *transport, QObject *parent)
    : IVideoService(parent)
    , transport_(transport)
    , baseUrl_(DefaultBaseUrl)
{
    connect(transport_, &IHttpTransport::finished,
            this, &StreamApiClient::onRequestFinished);
}

StreamApiClient::~StreamApiClient()
{
    // The transport may outlive us; drop what is still in flight
    for (auto it = pendingOperations_.constBegin(); it != pendingOperations_.constEnd(); ++it) {
        transport_->abort(it.key());
    }
}

void StreamApiClient::setBaseUrl(const QString &baseUrl)
{
    baseUrl_ = baseUrl;
    // Remove trailing slash if present
    if (baseUrl_.endsWith('/')) {
        baseUrl_.chop(1);
    }
}

QString StreamApiClient::libraryPath(const LibraryCredentials &credentials)
{
    return "/library/" + QString::fromUtf8(QUrl::toPercentEncoding(credentials.libraryId));
}

HttpRequest StreamApiClient::createRequest(const QByteArray &method, const QString &endpoint,
                                           const LibraryCredentials &credentials) const
{
    HttpRequest request;
    request.method = method;
    request.url = QUrl(baseUrl_ + endpoint);
    request.setHeader("Accept", "application/json");
    request.setHeader("AccessKey", credentials.apiKey.toUtf8());
    return request;
}

void StreamApiClient::sendRequest(const HttpRequest &request, const QString &tag,
                                  const QString &operation, int page)
{
    const quint64 id = transport_->send(request);
    pendingOperations_.insert(id, PendingOperation{tag, operation, page});
}

// Video registry

void StreamApiClient::createVideo(const QString &tag, const LibraryCredentials &credentials,
                                  const QString &title, const QString &collectionId)
{
    HttpRequest request = createRequest("POST", libraryPath(credentials) + "/videos", credentials);
    request.setHeader("Content-Type", "application/json");

    QJsonObject body;
    body["title"] = title;
    if (!collectionId.isEmpty()) {
        body["collectionId"] = collectionId;
    }
    request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);

    sendRequest(request, tag, OpCreateVideo);
}

void StreamApiClient::deleteVideo(const QString &tag, const LibraryCredentials &credentials,
                                  const QString &videoId)
{
    const QString endpoint = libraryPath(credentials) + "/videos/"
                             + QString::fromUtf8(QUrl::toPercentEncoding(videoId));
    sendRequest(createRequest("DELETE", endpoint, credentials), tag, OpDeleteVideo);
}

void StreamApiClient::fetchVideoDetails(const QString &tag, const LibraryCredentials &credentials,
                                        const QString &videoId)
{
    const QString endpoint = libraryPath(credentials) + "/videos/"
                             + QString::fromUtf8(QUrl::toPercentEncoding(videoId));
    sendRequest(createRequest("GET", endpoint, credentials), tag, OpFetchDetails);
}

void StreamApiClient::updateVideoTitle(const QString &tag, const LibraryCredentials &credentials,
                                       const QString &videoId, const QString &title)
{
    const QString endpoint = libraryPath(credentials) + "/videos/"
                             + QString::fromUtf8(QUrl::toPercentEncoding(videoId));
    HttpRequest request = createRequest("POST", endpoint, credentials);
    request.setHeader("Content-Type", "application/json");

    QJsonObject body;
    body["title"] = title;
    request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);

    sendRequest(request, tag, OpUpdateTitle);
}

void StreamApiClient::uploadThumbnail(const QString &tag, const LibraryCredentials &credentials,
                                      const QString &videoId, const QByteArray &imageData,
                                      const QString &mimeType)
{
    const QString endpoint = libraryPath(credentials) + "/videos/"
                             + QString::fromUtf8(QUrl::toPercentEncoding(videoId))
                             + "/thumbnail";
    HttpRequest request = createRequest("POST", endpoint, credentials);
    request.setHeader("Content-Type",
                      mimeType.isEmpty() ? QByteArray("image/jpeg") : mimeType.toUtf8());
    request.body = imageData;

    sendRequest(request, tag, OpUploadThumbnail);
}

void StreamApiClient::listVideos(const QString &tag, const LibraryCredentials &credentials,
                                 int page, int perPage)
{
    HttpRequest request = createRequest("GET", libraryPath(credentials) + "/videos", credentials);

    QUrlQuery query;
    query.addQueryItem("page", QString::number(page));
    query.addQueryItem("itemsPerPage", QString::number(perPage));
    query.addQueryItem("orderBy", "date");
    request.url.setQuery(query);

    sendRequest(request, tag, OpListVideos, page);
}

void StreamApiClient::listCollections(const QString &tag, const LibraryCredentials &credentials)
{
    HttpRequest request = createRequest("GET", libraryPath(credentials) + "/collections",
                                        credentials);
    QUrlQuery query;
    query.addQueryItem("page", "1");
    query.addQueryItem("itemsPerPage", "100");
    request.url.setQuery(query);

    sendRequest(request, tag, OpListCollections);
}

// Response handling

void StreamApiClient::onRequestFinished(quint64 requestId, const HttpResponse &response)
{
    if (!pendingOperations_.contains(requestId)) {
        return;  // Someone else's request on the shared transport
    }
    const PendingOperation op = pendingOperations_.take(requestId);

    if (!response.hasResponse()) {
        LOG_VERBOSE() << "Stream API:" << op.operation << "transport error" << response.errorString;
        emit operationFailed(op.tag, op.operation,
                             response.errorString.isEmpty() ? tr("Network error")
                                                            : response.errorString);
        return;
    }

    if (response.statusCode == 404 && op.operation == QLatin1String(OpFetchDetails)) {
        emit videoNotFound(op.tag);
        return;
    }

    if (!response.isSuccess()) {
        const QString errorMsg = extractError(response);
        qDebug() << "Stream API error for" << op.operation << ":" << errorMsg;
        emit operationFailed(op.tag, op.operation, errorMsg);
        return;
    }

    // Operations without a payload of interest
    if (op.operation == QLatin1String(OpDeleteVideo)
        || op.operation == QLatin1String(OpUpdateTitle)
        || op.operation == QLatin1String(OpUploadThumbnail)) {
        emit operationSucceeded(op.tag, op.operation);
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        emit operationFailed(op.tag, op.operation, tr("Invalid JSON response"));
        return;
    }
    const QJsonObject json = doc.object();

    // Route to specific handler
    if (op.operation == QLatin1String(OpCreateVideo)) {
        handleCreateResponse(op, json);
    } else if (op.operation == QLatin1String(OpFetchDetails)) {
        emit videoDetailsReceived(op.tag, parseVideo(json));
    } else if (op.operation == QLatin1String(OpListVideos)) {
        emit videoPageReceived(op.tag, parseVideoPage(json, op.page));
    } else if (op.operation == QLatin1String(OpListCollections)) {
        handleCollectionsResponse(op, json);
    } else {
        emit operationSucceeded(op.tag, op.operation);
    }
}

void StreamApiClient::handleCreateResponse(const PendingOperation &op, const QJsonObject &json)
{
    const QString guid = JsonFields::firstIdentifier(json, {"guid", "videoId", "id"});
    if (guid.isEmpty()) {
        emit operationFailed(op.tag, op.operation, tr("Response has no video id"));
        return;
    }
    LOG_VERBOSE() << "Stream API: created video" << guid;
    emit videoCreated(op.tag, guid);
}

void StreamApiClient::handleCollectionsResponse(const PendingOperation &op, const QJsonObject &json)
{
    QList<CollectionInfo> collections;
    const QJsonArray items = json.value("items").toArray();
    for (const QJsonValue &value : items) {
        const QJsonObject obj = value.toObject();
        CollectionInfo info;
        info.id = JsonFields::firstIdentifier(obj, {"guid", "id"});
        info.name = JsonFields::firstString(obj, {"name"});
        if (!info.id.isEmpty()) {
            collections.append(info);
        }
    }
    emit collectionsReceived(op.tag, collections);
}

VideoDetails StreamApiClient::parseVideo(const QJsonObject &json)
{
    VideoDetails details;
    details.videoId = JsonFields::firstIdentifier(json, {"guid", "videoId", "id"});
    details.title = json.value("title").toString();
    details.description = json.value("description").toString();
    details.thumbnailFileName = JsonFields::firstString(
        json, {"thumbnailFileName", "thumbnailFilename", "thumbnail", "thumbnailUrl", "thumbnailURL"});
    details.statusCode = static_cast<int>(JsonFields::firstInteger(json, {"status"}, -1));
    details.encodeProgress = JsonFields::firstNumber(
        json, {"encodeProgress", "processingPercentage"}, -1.0);
    details.durationSeconds = JsonFields::firstNumber(
        json, {"length", "duration", "videoDuration"}, -1.0);
    details.createdAt = JsonFields::firstDate(json, {"dateUploaded", "dateCreated"});
    return details;
}

VideoPage StreamApiClient::parseVideoPage(const QJsonObject &json, int requestedPage)
{
    VideoPage page;
    const QJsonArray items = json.value("items").toArray();
    for (const QJsonValue &value : items) {
        const VideoDetails details = parseVideo(value.toObject());
        if (!details.videoId.isEmpty()) {
            page.items.append(details);
        }
    }
    page.totalItems = static_cast<int>(
        JsonFields::firstInteger(json, {"totalItems"}, items.size()));
    page.itemsPerPage = static_cast<int>(
        JsonFields::firstInteger(json, {"itemsPerPage"}, items.size()));
    page.currentPage = static_cast<int>(
        JsonFields::firstInteger(json, {"currentPage"}, requestedPage));
    return page;
}

QString StreamApiClient::extractError(const HttpResponse &response)
{
    QString errorMsg = tr("HTTP %1").arg(response.statusCode);
    if (response.body.isEmpty()) {
        return errorMsg;
    }

    const QJsonDocument errorDoc = QJsonDocument::fromJson(response.body);
    if (errorDoc.isObject()) {
        const QString message = JsonFields::firstString(
            errorDoc.object(), {"Message", "message", "error", "title"});
        if (!message.isEmpty()) {
            return errorMsg + ": " + message;
        }
    }
    // Not JSON, include raw response
    return errorMsg + " - Response: "
           + QString::fromUtf8(response.body).left(ErrorResponsePreviewLength);
}
