#include "uploadqueue.h"
#include "../services/idlesleepguard.h"
#include "../services/librarystore.h"
#include "../services/uploadstore.h"
#include "../utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <QSet>
#include <QTimer>
#include <algorithm>
#include <utility>

UploadQueue::UploadQueue(QObject *parent)
    : QAbstractListModel(parent)
{
}

UploadQueue::~UploadQueue()
{
    // Sessions and the video service may still deliver signals while our
    // members are being torn down; cut them off first.
    for (TusUploadSession *session : std::as_const(sessions_)) {
        session->abort();
        disconnect(session, nullptr, this, nullptr);
    }
    sessions_.clear();

    if (videoService_) {
        disconnect(videoService_, nullptr, this, nullptr);
    }
}

void UploadQueue::setVideoService(IVideoService *service)
{
    if (videoService_) {
        disconnect(videoService_, nullptr, this, nullptr);
    }
    videoService_ = service;
    if (!videoService_) {
        return;
    }

    connect(videoService_, &IVideoService::videoCreated,
            this, &UploadQueue::onVideoCreated);
    connect(videoService_, &IVideoService::operationSucceeded,
            this, &UploadQueue::onVideoOperationSucceeded);
    connect(videoService_, &IVideoService::operationFailed,
            this, &UploadQueue::onVideoOperationFailed);
    connect(videoService_, &IVideoService::videoDetailsReceived,
            this, &UploadQueue::onVideoDetailsReceived);
    connect(videoService_, &IVideoService::videoNotFound,
            this, &UploadQueue::onVideoNotFound);
    connect(videoService_, &IVideoService::videoPageReceived,
            this, &UploadQueue::onVideoPageReceived);
}

void UploadQueue::scheduleAdmitNext()
{
    eventQueue_.enqueue([this]() { admitNext(); });

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &UploadQueue::processEventQueue);
    }
}

void UploadQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &UploadQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void UploadQueue::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

// ---------------------------------------------------------------------------
// Queue operations
// ---------------------------------------------------------------------------

QStringList UploadQueue::enqueue(const QStringList &files, const QString &libraryConfigId)
{
    QStringList ids;
    if (files.isEmpty()) {
        return ids;
    }

    LibraryConfig library;
    QString collectionId;
    bool hasKey = false;
    if (libraryStore_) {
        library = libraryStore_->library(libraryConfigId);
        collectionId = libraryStore_->defaultCollection(libraryConfigId);
        hasKey = library.isValid() && libraryStore_->hasApiKey(libraryConfigId);
    }

    const UploadStatus initial = hasKey ? UploadStatus::Pending : UploadStatus::Failed;
    const QString missingKey =
        tr("Missing API key. Please open Settings and set the Stream API key for this Library.");

    QList<UploadItem> added;
    for (const QString &path : files) {
        UploadItem item = UploadItem::create(path, libraryConfigId, library.libraryId, initial);
        item.collectionId = collectionId;
        item.totalBytes = QFileInfo(path).size();
        if (!hasKey) {
            item.errorMessage = missingKey;
            item.completedAt = item.createdAt;
        }
        added.append(item);
        ids.append(item.id);
    }

    const int first = items_.size();
    beginInsertRows(QModelIndex(), first, first + added.size() - 1);
    items_.append(added);
    endInsertRows();

    persist();
    emit queueChanged();

    if (!hasKey) {
        qWarning() << "UploadQueue: no API key for library" << libraryConfigId
                   << "-" << added.size() << "entries failed";
        for (const UploadItem &item : std::as_const(added)) {
            emit uploadFailed(item.id, ErrorCategory::Configuration, missingKey);
        }
        return ids;
    }

    LOG_VERBOSE() << "UploadQueue: enqueued" << added.size() << "files for library" << libraryConfigId;
    updateSleepGuard();
    scheduleAdmitNext();
    return ids;
}

void UploadQueue::admitNext()
{
    if (!online_) {
        LOG_VERBOSE() << "UploadQueue: admitNext - offline, waiting";
        return;
    }
    if (uploadingCount() >= MaxConcurrentUploads) {
        LOG_VERBOSE() << "UploadQueue: admitNext - upload already running";
        return;
    }

    const int index = findOldestPending();
    if (index < 0) {
        updateSleepGuard();
        return;
    }
    if (isCreatingVideo(items_[index].id)) {
        LOG_VERBOSE() << "UploadQueue: admitNext - waiting for the video id of" << items_[index].id;
        return;
    }
    startItem(index);
}

void UploadQueue::startItem(int index)
{
    UploadItem &entry = items_[index];
    const QString id = entry.id;

    const LibraryCredentials creds = credentialsFor(entry);
    if (!creds.isValid()) {
        const QString message =
            tr("Missing API key. Please open Settings and set the Stream API key for this Library.");
        entry.status = UploadStatus::Failed;
        entry.errorMessage = message;
        entry.completedAt = QDateTime::currentDateTimeUtc();
        notifyRowChanged(index);
        persist();
        emit uploadFailed(id, ErrorCategory::Configuration, message);
        scheduleAdmitNext();
        checkAllFinished();
        return;
    }
    if (!transport_ || !videoService_) {
        qWarning() << "UploadQueue: cannot start" << id << "- no transport or video service";
        return;
    }

    entry.status = UploadStatus::Uploading;
    entry.errorMessage.clear();
    entry.speedMBps = 0.0;
    entry.etaSeconds = 0.0;

    TusUploadParams params;
    params.filePath = entry.filePath;
    params.libraryId = creds.libraryId;
    params.apiKey = creds.apiKey;
    params.title = entry.fileName();
    params.collectionId = entry.collectionId;
    if (params.collectionId.isEmpty() && libraryStore_) {
        params.collectionId = libraryStore_->defaultCollection(entry.libraryConfigId);
    }
    params.videoId = entry.videoId;
    params.uploadUrl = QUrl(entry.tusUploadUrl);

    auto *session = new TusUploadSession(transport_, videoService_, this);
    if (tusEndpoint_.isValid()) {
        session->setEndpoint(tusEndpoint_);
    }
    session->setChunkSize(chunkSize_);
    session->setRetryPolicy(retryPolicy_);

    connect(session, &TusUploadSession::videoCreated, this,
            [this, session, id](const QString &videoId) { onSessionVideoCreated(session, id, videoId); });
    connect(session, &TusUploadSession::uploadUrlChanged, this,
            [this, session, id](const QUrl &url) { onSessionUploadUrlChanged(session, id, url); });
    connect(session, &TusUploadSession::progressChanged, this,
            [this, session, id](qint64 acknowledged, qint64 total, const TransferRate &rate) {
                onSessionProgress(session, id, acknowledged, total, rate);
            });
    connect(session, &TusUploadSession::completed, this,
            [this, session, id]() { onSessionCompleted(session, id); });
    connect(session, &TusUploadSession::paused, this,
            [this, session, id](const QString &reason) { onSessionPaused(session, id, reason); });
    connect(session, &TusUploadSession::failed, this,
            [this, session, id](ErrorCategory category, const QString &message) {
                onSessionFailed(session, id, category, message);
            });

    sessions_.insert(id, session);
    notifyRowChanged(index);
    persist();
    updateSleepGuard();

    qDebug() << "UploadQueue: starting" << entry.fileName()
             << (params.uploadUrl.isValid() ? "(resume)" : "(new)");
    emit uploadStarted(id);

    session->start(params);
}

void UploadQueue::pause(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0) {
        return;
    }
    detachSession(id);

    UploadItem &entry = items_[index];
    if (entry.isActiveOrPending()) {
        entry.status = UploadStatus::Paused;
        entry.lastResumeAttempt = QDateTime::currentDateTimeUtc();
        entry.speedMBps = 0.0;
        entry.etaSeconds = 0.0;
        notifyRowChanged(index);
        emit uploadPaused(id, tr("Paused by user"));
    }

    persist();
    updateSleepGuard();
    scheduleAdmitNext();
}

void UploadQueue::resume(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != UploadStatus::Paused) {
        return;
    }

    items_[index].status = UploadStatus::Pending;
    notifyRowChanged(index);
    persist();
    updateSleepGuard();
    scheduleAdmitNext();
}

void UploadQueue::pauseAll()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    bool changed = false;
    for (int i = 0; i < items_.size(); ++i) {
        UploadItem &entry = items_[i];
        if (!entry.isActiveOrPending()) {
            continue;
        }
        detachSession(entry.id);
        entry.status = UploadStatus::Paused;
        entry.lastResumeAttempt = now;
        entry.speedMBps = 0.0;
        entry.etaSeconds = 0.0;
        notifyRowChanged(i);
        changed = true;
    }

    if (changed) {
        persist();
        emit statusMessage(tr("All uploads paused"), 3000);
    }
    updateSleepGuard();
}

void UploadQueue::resumeAll()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    bool changed = false;
    for (int i = 0; i < items_.size(); ++i) {
        UploadItem &entry = items_[i];
        if (entry.status != UploadStatus::Paused) {
            continue;
        }
        entry.status = UploadStatus::Pending;
        entry.lastResumeAttempt = now;
        notifyRowChanged(i);
        changed = true;
    }

    if (changed) {
        persist();
        updateSleepGuard();
        scheduleAdmitNext();
    }
}

void UploadQueue::cancel(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0) {
        return;
    }
    detachSession(id);

    UploadItem &entry = items_[index];

    // A delete is already in flight for this entry
    if (entry.status == UploadStatus::Canceled) {
        removeItemAt(index);
        scheduleAdmitNext();
        return;
    }

    const LibraryCredentials creds = credentialsFor(entry);
    if (!entry.hasVideo() || entry.status == UploadStatus::Success || !creds.isValid()
        || !videoService_) {
        removeItemAt(index);
        scheduleAdmitNext();
        return;
    }

    entry.status = UploadStatus::Canceled;
    entry.speedMBps = 0.0;
    entry.etaSeconds = 0.0;
    notifyRowChanged(index);
    persist();
    updateSleepGuard();

    issueCancelDelete(index, creds);
    scheduleAdmitNext();
}

void UploadQueue::issueCancelDelete(int index, const LibraryCredentials &creds)
{
    ApiCall call;
    call.kind = ApiCall::CancelDelete;
    call.itemId = items_[index].id;
    videoService_->deleteVideo(issueCall(call), creds, items_[index].videoId);
}

void UploadQueue::removeFromHistory(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0) {
        return;
    }

    const UploadStatus status = items_[index].status;
    if (status == UploadStatus::Success || status == UploadStatus::Failed) {
        removeItemAt(index);
    } else {
        cancel(id);
    }
}

void UploadQueue::clearAll()
{
    const QStringList active = sessions_.keys();
    for (const QString &id : active) {
        detachSession(id);
    }
    for (auto it = apiCalls_.begin(); it != apiCalls_.end();) {
        if (it.value().kind == ApiCall::Bootstrap) {
            it = apiCalls_.erase(it);
        } else {
            ++it;
        }
    }

    beginResetModel();
    items_.clear();
    endResetModel();

    syncs_.clear();
    persist();
    updateSleepGuard();
    emit queueChanged();
}

void UploadQueue::load()
{
    if (!uploadStore_) {
        return;
    }

    QList<UploadItem> loaded = uploadStore_->load();
    for (UploadItem &entry : loaded) {
        const bool interrupted = entry.status == UploadStatus::Uploading;
        if (autoResume_) {
            if (interrupted || entry.status == UploadStatus::Paused) {
                entry.status = UploadStatus::Pending;
            }
        } else if (interrupted) {
            entry.status = UploadStatus::Paused;
            entry.lastResumeAttempt = QDateTime::currentDateTimeUtc();
        }
        if (!entry.isTerminal()) {
            entry.speedMBps = 0.0;
            entry.etaSeconds = 0.0;
        }
    }

    beginResetModel();
    items_ = loaded;
    endResetModel();

    qInfo() << "UploadQueue: restored" << items_.size() << "entries," << pendingCount() << "pending";

    persist();
    emit queueChanged();
    restoreCanceled();
    updateSleepGuard();
    scheduleAdmitNext();
}

void UploadQueue::restoreCanceled()
{
    // The process stopped while these deletes were in flight
    QStringList canceled;
    for (const UploadItem &entry : std::as_const(items_)) {
        if (entry.status == UploadStatus::Canceled) {
            canceled.append(entry.id);
        }
    }

    for (const QString &id : std::as_const(canceled)) {
        const int index = findItemIndex(id);
        const LibraryCredentials creds = credentialsFor(items_[index]);
        if (!items_[index].hasVideo() || !creds.isValid() || !videoService_) {
            removeItemAt(index);
            continue;
        }
        LOG_VERBOSE() << "UploadQueue: repeating remote delete of" << items_[index].videoId;
        issueCancelDelete(index, creds);
    }
}

void UploadQueue::onConnectivityChanged(bool connected)
{
    if (online_ == connected) {
        return;
    }
    online_ = connected;

    if (!connected) {
        const QDateTime now = QDateTime::currentDateTimeUtc();
        for (int i = 0; i < items_.size(); ++i) {
            UploadItem &entry = items_[i];
            if (entry.status != UploadStatus::Uploading) {
                continue;
            }
            detachSession(entry.id);
            entry.status = UploadStatus::Paused;
            entry.lastResumeAttempt = now;
            entry.speedMBps = 0.0;
            entry.etaSeconds = 0.0;
            notifyRowChanged(i);
            emit uploadPaused(entry.id, tr("Network unavailable"));
        }
        persist();
        updateSleepGuard();
        return;
    }

    if (autoResume_) {
        for (int i = 0; i < items_.size(); ++i) {
            UploadItem &entry = items_[i];
            if (entry.status == UploadStatus::Paused && entry.lastResumeAttempt.isValid()) {
                entry.status = UploadStatus::Pending;
                notifyRowChanged(i);
            }
        }
        persist();
    }
    updateSleepGuard();
    scheduleAdmitNext();
}

// ---------------------------------------------------------------------------
// Session events
// ---------------------------------------------------------------------------

int UploadQueue::activeIndexFor(TusUploadSession *session, const QString &id) const
{
    if (sessions_.value(id) != session) {
        return -1;  // Stale session
    }
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != UploadStatus::Uploading) {
        return -1;
    }
    return index;
}

void UploadQueue::onSessionVideoCreated(TusUploadSession *session, const QString &id,
                                        const QString &videoId)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }
    items_[index].videoId = videoId;
    notifyRowChanged(index);
    persist();
}

void UploadQueue::onSessionUploadUrlChanged(TusUploadSession *session, const QString &id,
                                            const QUrl &url)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }
    items_[index].tusUploadUrl = url.toString();
    persist();
}

void UploadQueue::onSessionProgress(TusUploadSession *session, const QString &id,
                                    qint64 acknowledged, qint64 total, const TransferRate &rate)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }

    UploadItem &entry = items_[index];
    entry.totalBytes = total;
    entry.bytesUploaded = qMax(entry.bytesUploaded, acknowledged);
    entry.progress = total > 0 ? static_cast<double>(entry.bytesUploaded) / total : 0.0;
    entry.speedMBps = rate.megabytesPerSecond();
    entry.etaSeconds = rate.etaSeconds;

    notifyRowChanged(index);
    persist();
}

void UploadQueue::onSessionCompleted(TusUploadSession *session, const QString &id)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }
    finishSession(id);

    UploadItem &entry = items_[index];
    entry.status = UploadStatus::Success;
    entry.progress = 1.0;
    entry.bytesUploaded = entry.totalBytes;
    entry.speedMBps = 0.0;
    entry.etaSeconds = 0.0;
    entry.errorMessage.clear();
    entry.completedAt = QDateTime::currentDateTimeUtc();

    notifyRowChanged(index);
    persist();

    qInfo() << "UploadQueue: upload finished" << entry.fileName() << "video" << entry.videoId;
    emit uploadCompleted(id);
    emit statusMessage(tr("Uploaded %1").arg(entry.fileName()), 3000);

    scheduleReadyPoll(id, 0, 0);
    updateSleepGuard();
    scheduleAdmitNext();
    checkAllFinished();
}

void UploadQueue::onSessionPaused(TusUploadSession *session, const QString &id, const QString &reason)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }
    finishSession(id);

    UploadItem &entry = items_[index];
    entry.status = UploadStatus::Paused;
    entry.lastResumeAttempt = QDateTime::currentDateTimeUtc();
    entry.speedMBps = 0.0;
    entry.etaSeconds = 0.0;

    notifyRowChanged(index);
    persist();
    updateSleepGuard();

    qInfo() << "UploadQueue: upload paused" << entry.fileName() << "-" << reason;
    emit uploadPaused(id, reason);
    // Admission waits for connectivity to come back or for the user
}

void UploadQueue::onSessionFailed(TusUploadSession *session, const QString &id,
                                  ErrorCategory category, const QString &message)
{
    const int index = activeIndexFor(session, id);
    if (index < 0) {
        return;
    }
    finishSession(id);

    UploadItem &entry = items_[index];
    entry.status = UploadStatus::Failed;
    entry.errorMessage = message;
    entry.completedAt = QDateTime::currentDateTimeUtc();
    entry.speedMBps = 0.0;
    entry.etaSeconds = 0.0;

    notifyRowChanged(index);
    persist();

    emit uploadFailed(id, category, message);

    updateSleepGuard();
    scheduleAdmitNext();
    checkAllFinished();
}

void UploadQueue::detachSession(const QString &id)
{
    TusUploadSession *session = sessions_.take(id);
    if (!session) {
        return;
    }
    if (session->isCreatingVideo()) {
        // The reply still carries the id of the new remote video
        const int index = findItemIndex(id);
        ApiCall call;
        call.kind = ApiCall::Bootstrap;
        call.itemId = id;
        if (index >= 0) {
            call.libraryConfigId = items_[index].libraryConfigId;
        }
        apiCalls_.insert(session->serviceTag(), call);
    }
    session->abort();
    disconnect(session, nullptr, this, nullptr);
    session->deleteLater();
}

void UploadQueue::finishSession(const QString &id)
{
    // Called from the session's own signal, so it must outlive this call stack
    TusUploadSession *session = sessions_.take(id);
    if (session) {
        disconnect(session, nullptr, this, nullptr);
        session->deleteLater();
    }
}

// ---------------------------------------------------------------------------
// Remote metadata
// ---------------------------------------------------------------------------

QString UploadQueue::issueCall(const ApiCall &call)
{
    const QString tag = QString("queue:%1").arg(nextTag_++);
    apiCalls_.insert(tag, call);
    return tag;
}

LibraryCredentials UploadQueue::credentialsFor(const UploadItem &item) const
{
    if (!libraryStore_) {
        return LibraryCredentials();
    }
    LibraryCredentials creds = libraryStore_->credentials(item.libraryConfigId);
    if (creds.libraryId.isEmpty()) {
        creds.libraryId = item.libraryId;
    }
    return creds;
}

void UploadQueue::requestDetails(const QString &id, ApiCall::Kind kind, int attempt)
{
    const int index = findItemIndex(id);
    if (index < 0 || !videoService_) {
        return;
    }
    const LibraryCredentials creds = credentialsFor(items_[index]);
    if (!creds.isValid() || !items_[index].hasVideo()) {
        return;
    }

    ApiCall call;
    call.kind = kind;
    call.itemId = id;
    call.attempt = attempt;
    videoService_->fetchVideoDetails(issueCall(call), creds, items_[index].videoId);
}

bool UploadQueue::refreshVideoDetails(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0 || !videoService_ || !items_[index].hasVideo()
        || !credentialsFor(items_[index]).isValid()) {
        return false;
    }
    requestDetails(id, ApiCall::Refresh);
    return true;
}

void UploadQueue::scheduleReadyPoll(const QString &id, int attempt, int delayMs)
{
    if (attempt >= MaxReadyPolls) {
        LOG_VERBOSE() << "UploadQueue: giving up waiting for processing of" << id;
        return;
    }
    QTimer::singleShot(delayMs, this, [this, id, attempt]() {
        const int index = findItemIndex(id);
        if (index < 0 || items_[index].status != UploadStatus::Success
            || items_[index].processingReadyNotified) {
            return;
        }
        requestDetails(id, ApiCall::ReadyPoll, attempt);
    });
}

void UploadQueue::applyDetails(int index, const VideoDetails &details)
{
    UploadItem &entry = items_[index];
    if (!details.title.isEmpty()) {
        entry.remoteTitle = details.title;
    }
    entry.remoteDescription = details.description;
    if (!details.thumbnailFileName.isEmpty()) {
        entry.remoteThumbnailPath = details.thumbnailFileName;
    }
    entry.remoteStatusCode = details.statusCode;
    entry.remoteEncodeProgress = details.encodeProgress;
    entry.remoteDurationSeconds = details.durationSeconds;

    const bool becameReady = details.isReady() && !entry.processingReadyNotified;
    if (becameReady) {
        entry.processingReadyNotified = true;
    }

    notifyRowChanged(index);
    persist();

    if (becameReady) {
        qInfo() << "UploadQueue: video ready" << entry.displayTitle();
        emit videoReady(entry.id, entry.displayTitle());
    }
}

bool UploadQueue::updateTitle(const QString &id, const QString &title)
{
    const int index = findItemIndex(id);
    if (index < 0 || !videoService_ || !items_[index].hasVideo()) {
        return false;
    }
    const LibraryCredentials creds = credentialsFor(items_[index]);
    if (!creds.isValid()) {
        return false;
    }

    ApiCall call;
    call.kind = ApiCall::UpdateTitle;
    call.itemId = id;
    videoService_->updateVideoTitle(issueCall(call), creds, items_[index].videoId, title);
    return true;
}

bool UploadQueue::uploadThumbnail(const QString &id, const QByteArray &imageData,
                                  const QString &mimeType)
{
    const int index = findItemIndex(id);
    if (index < 0 || !videoService_ || !items_[index].hasVideo() || imageData.isEmpty()) {
        return false;
    }
    const LibraryCredentials creds = credentialsFor(items_[index]);
    if (!creds.isValid()) {
        return false;
    }

    ApiCall call;
    call.kind = ApiCall::Thumbnail;
    call.itemId = id;
    videoService_->uploadThumbnail(issueCall(call), creds, items_[index].videoId,
                                   imageData, mimeType);
    return true;
}

void UploadQueue::deleteFromRemote(const QString &id)
{
    const int index = findItemIndex(id);
    if (index < 0) {
        emit remoteDeleteFinished(id, false);
        return;
    }

    if (!items_[index].hasVideo()) {
        removeItemAt(index);
        emit remoteDeleteFinished(id, true);
        return;
    }

    const LibraryCredentials creds = credentialsFor(items_[index]);
    if (!creds.isValid() || !videoService_) {
        emit remoteDeleteFinished(id, false);
        return;
    }

    UploadItem &entry = items_[index];
    if (entry.isActiveOrPending()) {
        // Kept out of admission until the delete returns
        detachSession(id);
        entry.status = UploadStatus::Paused;
        entry.lastResumeAttempt = QDateTime::currentDateTimeUtc();
        entry.speedMBps = 0.0;
        entry.etaSeconds = 0.0;
        notifyRowChanged(index);
        persist();
        updateSleepGuard();
        emit uploadPaused(id, tr("Deleting remote video"));
        scheduleAdmitNext();
    }

    ApiCall call;
    call.kind = ApiCall::RemoteDelete;
    call.itemId = id;
    videoService_->deleteVideo(issueCall(call), creds, items_[index].videoId);
}

void UploadQueue::syncLibrary(const QString &libraryConfigId)
{
    if (!libraryStore_ || !videoService_) {
        emit librarySynced(libraryConfigId, false);
        return;
    }
    const LibraryCredentials creds = libraryStore_->credentials(libraryConfigId);
    if (!creds.isValid()) {
        emit librarySynced(libraryConfigId, false);
        return;
    }
    if (syncs_.contains(libraryConfigId)) {
        return;  // Already running
    }

    syncs_.insert(libraryConfigId, SyncState());
    requestPage(libraryConfigId, 1);
}

void UploadQueue::requestPage(const QString &libraryConfigId, int page)
{
    const LibraryCredentials creds = libraryStore_->credentials(libraryConfigId);
    ApiCall call;
    call.kind = ApiCall::ListPage;
    call.libraryConfigId = libraryConfigId;
    videoService_->listVideos(issueCall(call), creds, page, SyncPageSize);
}

void UploadQueue::mergeLibrary(const QString &libraryConfigId, const QList<VideoDetails> &remote)
{
    QHash<QString, VideoDetails> byId;
    for (const VideoDetails &video : remote) {
        if (!video.videoId.isEmpty()) {
            byId.insert(video.videoId, video);
        }
    }

    beginResetModel();

    QSet<QString> known;
    for (int i = items_.size() - 1; i >= 0; --i) {
        UploadItem &entry = items_[i];
        if (entry.libraryConfigId != libraryConfigId || !entry.hasVideo()) {
            continue;
        }

        auto it = byId.constFind(entry.videoId);
        if (it == byId.constEnd()) {
            // In-flight entries are kept even if the listing lags behind
            if (entry.isTerminal()) {
                items_.removeAt(i);
            }
            continue;
        }

        known.insert(entry.videoId);
        const VideoDetails &video = it.value();
        if (!video.title.isEmpty()) {
            entry.remoteTitle = video.title;
        }
        if (!video.thumbnailFileName.isEmpty()) {
            entry.remoteThumbnailPath = video.thumbnailFileName;
        }
        entry.remoteStatusCode = video.statusCode;
        entry.remoteEncodeProgress = video.encodeProgress;
        entry.remoteDurationSeconds = video.durationSeconds;
        if (video.createdAt.isValid()) {
            entry.createdAt = video.createdAt;
            entry.completedAt = video.createdAt;
        }
        if (entry.status == UploadStatus::Success) {
            entry.progress = 1.0;
        }
    }

    const QString libraryId = libraryStore_ ? libraryStore_->library(libraryConfigId).libraryId
                                            : QString();
    for (const VideoDetails &video : remote) {
        if (video.videoId.isEmpty() || known.contains(video.videoId)) {
            continue;
        }
        known.insert(video.videoId);

        UploadItem entry = UploadItem::create(QString("/remote/%1").arg(video.videoId),
                                              libraryConfigId, libraryId, UploadStatus::Success);
        const QDateTime date = video.createdAt.isValid()
                                   ? video.createdAt
                                   : QDateTime::fromMSecsSinceEpoch(0).toUTC();
        entry.createdAt = date;
        entry.completedAt = date;
        entry.videoId = video.videoId;
        entry.progress = 1.0;
        entry.remoteTitle = video.title;
        entry.remoteDescription = video.description;
        entry.remoteThumbnailPath = video.thumbnailFileName;
        entry.remoteStatusCode = video.statusCode;
        entry.remoteEncodeProgress = video.encodeProgress;
        entry.remoteDurationSeconds = video.durationSeconds;
        entry.processingReadyNotified = video.isReady();
        items_.append(entry);
    }

    endResetModel();

    persist();
    emit queueChanged();
}

// ---------------------------------------------------------------------------
// Video service events
// ---------------------------------------------------------------------------

void UploadQueue::onVideoCreated(const QString &tag, const QString &videoId)
{
    // Replies of running sessions are handled by the session itself
    auto it = apiCalls_.constFind(tag);
    if (it == apiCalls_.constEnd() || it.value().kind != ApiCall::Bootstrap) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);

    const int index = findItemIndex(call.itemId);
    if (index >= 0 && !items_[index].hasVideo()) {
        items_[index].videoId = videoId;
        notifyRowChanged(index);
        persist();
        qDebug() << "UploadQueue: video" << videoId << "kept for" << items_[index].fileName();
        scheduleAdmitNext();
        return;
    }

    const LibraryCredentials creds = libraryStore_ ? libraryStore_->credentials(call.libraryConfigId)
                                                   : LibraryCredentials();
    if (!creds.isValid() || !videoService_) {
        qWarning() << "UploadQueue: cannot delete unused video" << videoId;
        scheduleAdmitNext();
        return;
    }
    qInfo() << "UploadQueue: deleting video" << videoId << "of a removed entry";
    ApiCall discard;
    discard.kind = ApiCall::DiscardVideo;
    discard.itemId = call.itemId;
    videoService_->deleteVideo(issueCall(discard), creds, videoId);
    scheduleAdmitNext();
}

void UploadQueue::onVideoOperationSucceeded(const QString &tag, const QString &operation)
{
    if (!apiCalls_.contains(tag)) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);
    LOG_VERBOSE() << "UploadQueue:" << operation << "succeeded for" << call.itemId;

    switch (call.kind) {
    case ApiCall::CancelDelete:
        removeItem(call.itemId);
        break;
    case ApiCall::RemoteDelete:
        removeItem(call.itemId);
        emit remoteDeleteFinished(call.itemId, true);
        break;
    case ApiCall::UpdateTitle:
        emit titleUpdateFinished(call.itemId, true);
        requestDetails(call.itemId, ApiCall::Refresh);
        break;
    case ApiCall::Thumbnail: {
        const int index = findItemIndex(call.itemId);
        if (index >= 0) {
            // Invalidate the cached thumbnail so the next refresh picks up the new one
            items_[index].remoteThumbnailPath.clear();
            notifyRowChanged(index);
            persist();
        }
        emit thumbnailUploadFinished(call.itemId, true);
        break;
    }
    default:
        break;
    }
}

void UploadQueue::onVideoOperationFailed(const QString &tag, const QString &operation,
                                         const QString &error)
{
    if (!apiCalls_.contains(tag)) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);
    qWarning() << "UploadQueue:" << operation << "failed:" << error;

    switch (call.kind) {
    case ApiCall::Bootstrap:
        scheduleAdmitNext();
        break;
    case ApiCall::CancelDelete:
        // The entry goes away locally whatever the remote outcome
        removeItem(call.itemId);
        break;
    case ApiCall::RemoteDelete:
        emit remoteDeleteFinished(call.itemId, false);
        emit statusMessage(tr("Delete failed: %1").arg(error), 5000);
        break;
    case ApiCall::UpdateTitle:
        emit titleUpdateFinished(call.itemId, false);
        break;
    case ApiCall::Thumbnail:
        emit thumbnailUploadFinished(call.itemId, false);
        break;
    case ApiCall::ReadyPoll:
        scheduleReadyPoll(call.itemId, call.attempt + 1, pollIntervalMs_);
        break;
    case ApiCall::ListPage:
        syncs_.remove(call.libraryConfigId);
        emit librarySynced(call.libraryConfigId, false);
        break;
    case ApiCall::DiscardVideo:
    case ApiCall::Refresh:
        break;
    }
}

void UploadQueue::onVideoDetailsReceived(const QString &tag, const VideoDetails &details)
{
    if (!apiCalls_.contains(tag)) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);
    const int index = findItemIndex(call.itemId);
    if (index < 0) {
        return;
    }

    applyDetails(index, details);

    if (call.kind == ApiCall::ReadyPoll && !items_[index].processingReadyNotified) {
        scheduleReadyPoll(call.itemId, call.attempt + 1, pollIntervalMs_);
    }
}

void UploadQueue::onVideoNotFound(const QString &tag)
{
    if (!apiCalls_.contains(tag)) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);
    qInfo() << "UploadQueue: remote video gone, removing" << call.itemId;
    removeItem(call.itemId);
}

void UploadQueue::onVideoPageReceived(const QString &tag, const VideoPage &page)
{
    if (!apiCalls_.contains(tag)) {
        return;
    }
    const ApiCall call = apiCalls_.take(tag);
    const QString configId = call.libraryConfigId;
    if (!syncs_.contains(configId)) {
        return;  // Cleared meanwhile
    }

    SyncState &sync = syncs_[configId];
    sync.collected.append(page.items);

    if (page.hasMore()) {
        requestPage(configId, page.currentPage + 1);
        return;
    }

    const QList<VideoDetails> remote = sync.collected;
    syncs_.remove(configId);
    mergeLibrary(configId, remote);

    qInfo() << "UploadQueue: library" << configId << "synced," << remote.size() << "remote videos";
    emit librarySynced(configId, true);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void UploadQueue::removeItemAt(int index)
{
    const QString id = items_[index].id;
    detachSession(id);

    beginRemoveRows(QModelIndex(), index, index);
    items_.removeAt(index);
    endRemoveRows();

    persist();
    updateSleepGuard();
    emit itemRemoved(id);
    emit queueChanged();
}

void UploadQueue::removeItem(const QString &id)
{
    const int index = findItemIndex(id);
    if (index >= 0) {
        removeItemAt(index);
    }
}

void UploadQueue::notifyRowChanged(int index)
{
    const QModelIndex modelIndex = this->index(index);
    emit dataChanged(modelIndex, modelIndex);
    emit itemChanged(items_[index].id);
}

void UploadQueue::persist()
{
    if (uploadStore_ && !uploadStore_->save(items_)) {
        qWarning() << "UploadQueue: queue state not saved to" << uploadStore_->filePath();
    }
}

void UploadQueue::updateSleepGuard()
{
    if (sleepGuard_) {
        sleepGuard_->update(hasActiveOrPending());
    }
}

void UploadQueue::checkAllFinished()
{
    if (!hasActiveOrPending()) {
        emit allUploadsFinished();
    }
}

UploadItem UploadQueue::item(const QString &id) const
{
    const int index = findItemIndex(id);
    return index >= 0 ? items_[index] : UploadItem();
}

int UploadQueue::uploadingCount() const
{
    return static_cast<int>(std::count_if(items_.begin(), items_.end(), [](const UploadItem &entry) {
        return entry.status == UploadStatus::Uploading;
    }));
}

int UploadQueue::pendingCount() const
{
    return static_cast<int>(std::count_if(items_.begin(), items_.end(), [](const UploadItem &entry) {
        return entry.status == UploadStatus::Pending;
    }));
}

bool UploadQueue::hasActiveOrPending() const
{
    return std::any_of(items_.begin(), items_.end(), [](const UploadItem &entry) {
        return entry.isActiveOrPending();
    });
}

bool UploadQueue::isCreatingVideo(const QString &id) const
{
    for (auto it = apiCalls_.constBegin(); it != apiCalls_.constEnd(); ++it) {
        if (it.value().kind == ApiCall::Bootstrap && it.value().itemId == id) {
            return true;
        }
    }
    return false;
}

int UploadQueue::findItemIndex(const QString &id) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].id == id) {
            return i;
        }
    }
    return -1;
}

int UploadQueue::findOldestPending() const
{
    int best = -1;
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].status != UploadStatus::Pending) {
            continue;
        }
        const UploadItem &entry = items_[i];
        if (best < 0 || entry.createdAt < items_[best].createdAt
            || (entry.createdAt == items_[best].createdAt && entry.id < items_[best].id)) {
            best = i;
        }
    }
    return best;
}

// ---------------------------------------------------------------------------
// QAbstractListModel
// ---------------------------------------------------------------------------

int UploadQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return items_.size();
}

QVariant UploadQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const UploadItem &entry = items_.at(index.row());

    switch (role) {
    case Qt::DisplayRole:
    case TitleRole:
        return entry.displayTitle();
    case IdRole:
        return entry.id;
    case FilePathRole:
        return entry.filePath;
    case FileNameRole:
        return entry.fileName();
    case StatusRole:
        return static_cast<int>(entry.status);
    case StatusLabelRole:
        return uploadStatusLabel(entry.status);
    case ProgressRole:
        return entry.progress;
    case SpeedRole:
        return entry.speedMBps;
    case EtaRole:
        return entry.etaFormatted();
    case BytesUploadedRole:
        return entry.bytesUploaded;
    case TotalBytesRole:
        return entry.totalBytes;
    case VideoIdRole:
        return entry.videoId;
    case ErrorMessageRole:
        return entry.errorMessage;
    case EncodeProgressRole:
        return entry.remoteEncodeProgress;
    case LibraryConfigIdRole:
        return entry.libraryConfigId;
    case CreatedAtRole:
        return entry.createdAt;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> UploadQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "id";
    roles[FilePathRole] = "filePath";
    roles[FileNameRole] = "fileName";
    roles[TitleRole] = "title";
    roles[StatusRole] = "status";
    roles[StatusLabelRole] = "statusLabel";
    roles[ProgressRole] = "progress";
    roles[SpeedRole] = "speed";
    roles[EtaRole] = "eta";
    roles[BytesUploadedRole] = "bytesUploaded";
    roles[TotalBytesRole] = "totalBytes";
    roles[VideoIdRole] = "videoId";
    roles[ErrorMessageRole] = "errorMessage";
    roles[EncodeProgressRole] = "encodeProgress";
    roles[LibraryConfigIdRole] = "libraryConfigId";
    roles[CreatedAtRole] = "createdAt";
    return roles;
}
