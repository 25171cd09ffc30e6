#include "mockvideoservice.h"

#include <QTimer>

MockVideoService::MockVideoService(QObject *parent)
    : IVideoService(parent)
{
}

void MockVideoService::createVideo(const QString &tag, const LibraryCredentials &credentials,
                                   const QString &title, const QString &collectionId)
{
    Call call;
    call.operation = OpCreateVideo;
    call.tag = tag;
    call.credentials = credentials;
    call.title = title;
    call.collectionId = collectionId;
    record(call);

    if (failIfConfigured(tag, OpCreateVideo)) {
        return;
    }

    VideoDetails video;
    video.videoId = QString("video-%1").arg(nextVideo_++);
    video.title = title;
    video.statusCode = 0;
    video.encodeProgress = 0;
    video.createdAt = QDateTime::currentDateTimeUtc();
    mockAddVideo(video);

    const QString videoId = video.videoId;
    respond([this, tag, videoId]() { emit videoCreated(tag, videoId); });
}

void MockVideoService::deleteVideo(const QString &tag, const LibraryCredentials &credentials,
                                   const QString &videoId)
{
    Call call;
    call.operation = OpDeleteVideo;
    call.tag = tag;
    call.credentials = credentials;
    call.videoId = videoId;
    record(call);

    if (failIfConfigured(tag, OpDeleteVideo)) {
        return;
    }
    mockRemoveVideo(videoId);
    respond([this, tag]() { emit operationSucceeded(tag, QLatin1String(OpDeleteVideo)); });
}

void MockVideoService::fetchVideoDetails(const QString &tag, const LibraryCredentials &credentials,
                                         const QString &videoId)
{
    Call call;
    call.operation = OpFetchDetails;
    call.tag = tag;
    call.credentials = credentials;
    call.videoId = videoId;
    record(call);

    if (failIfConfigured(tag, OpFetchDetails)) {
        return;
    }

    // Looked up at delivery time so catalog changes made meanwhile count
    respond([this, tag, videoId]() {
        const int index = indexOf(videoId);
        if (index < 0) {
            emit videoNotFound(tag);
            return;
        }
        emit videoDetailsReceived(tag, catalog_.at(index));
    });
}

void MockVideoService::updateVideoTitle(const QString &tag, const LibraryCredentials &credentials,
                                        const QString &videoId, const QString &title)
{
    Call call;
    call.operation = OpUpdateTitle;
    call.tag = tag;
    call.credentials = credentials;
    call.videoId = videoId;
    call.title = title;
    record(call);

    if (failIfConfigured(tag, OpUpdateTitle)) {
        return;
    }
    const int index = indexOf(videoId);
    if (index >= 0) {
        catalog_[index].title = title;
    }
    respond([this, tag]() { emit operationSucceeded(tag, QLatin1String(OpUpdateTitle)); });
}

void MockVideoService::uploadThumbnail(const QString &tag, const LibraryCredentials &credentials,
                                       const QString &videoId, const QByteArray &imageData,
                                       const QString &mimeType)
{
    Call call;
    call.operation = OpUploadThumbnail;
    call.tag = tag;
    call.credentials = credentials;
    call.videoId = videoId;
    call.data = imageData;
    call.mimeType = mimeType;
    record(call);

    if (failIfConfigured(tag, OpUploadThumbnail)) {
        return;
    }
    respond([this, tag]() { emit operationSucceeded(tag, QLatin1String(OpUploadThumbnail)); });
}

void MockVideoService::listVideos(const QString &tag, const LibraryCredentials &credentials,
                                  int page, int perPage)
{
    Call call;
    call.operation = OpListVideos;
    call.tag = tag;
    call.credentials = credentials;
    call.page = page;
    call.perPage = perPage;
    record(call);

    if (failIfConfigured(tag, OpListVideos)) {
        return;
    }

    VideoPage result;
    result.currentPage = page;
    result.itemsPerPage = perPage;
    result.totalItems = catalog_.size();
    const int first = (page - 1) * perPage;
    for (int i = first; i >= 0 && i < catalog_.size() && i < first + perPage; ++i) {
        result.items.append(catalog_.at(i));
    }
    respond([this, tag, result]() { emit videoPageReceived(tag, result); });
}

void MockVideoService::listCollections(const QString &tag, const LibraryCredentials &credentials)
{
    Call call;
    call.operation = OpListCollections;
    call.tag = tag;
    call.credentials = credentials;
    record(call);

    if (failIfConfigured(tag, OpListCollections)) {
        return;
    }
    const QList<CollectionInfo> collections = collections_;
    respond([this, tag, collections]() { emit collectionsReceived(tag, collections); });
}

void MockVideoService::mockAddVideo(const VideoDetails &video)
{
    const int index = indexOf(video.videoId);
    if (index >= 0) {
        catalog_[index] = video;
    } else {
        catalog_.append(video);
    }
}

void MockVideoService::mockRemoveVideo(const QString &videoId)
{
    const int index = indexOf(videoId);
    if (index >= 0) {
        catalog_.removeAt(index);
    }
}

VideoDetails MockVideoService::mockVideo(const QString &videoId) const
{
    const int index = indexOf(videoId);
    return index >= 0 ? catalog_.at(index) : VideoDetails();
}

void MockVideoService::mockSetFailure(const QString &operation, const QString &error)
{
    if (error.isEmpty()) {
        failures_.remove(operation);
    } else {
        failures_.insert(operation, error);
    }
}

void MockVideoService::mockProcessAll()
{
    while (!pending_.isEmpty()) {
        auto result = pending_.dequeue();
        result();
    }
}

QList<MockVideoService::Call> MockVideoService::mockCalls(const QString &operation) const
{
    QList<Call> result;
    for (const Call &call : calls_) {
        if (call.operation == operation) {
            result.append(call);
        }
    }
    return result;
}

int MockVideoService::mockCallCount(const QString &operation) const
{
    return mockCalls(operation).size();
}

void MockVideoService::record(const Call &call)
{
    calls_.append(call);
}

void MockVideoService::respond(const std::function<void()> &result)
{
    pending_.enqueue(result);
    if (autoRespond_) {
        QTimer::singleShot(0, this, [this]() {
            if (!pending_.isEmpty()) {
                auto next = pending_.dequeue();
                next();
            }
        });
    }
}

bool MockVideoService::failIfConfigured(const QString &tag, const QString &operation)
{
    if (!failures_.contains(operation)) {
        return false;
    }
    const QString error = failures_.value(operation);
    respond([this, tag, operation, error]() { emit operationFailed(tag, operation, error); });
    return true;
}

int MockVideoService::indexOf(const QString &videoId) const
{
    for (int i = 0; i < catalog_.size(); ++i) {
        if (catalog_.at(i).videoId == videoId) {
            return i;
        }
    }
    return -1;
}
