/**
 * @file uploadqueue.h
 * @brief Persistent FIFO queue of video uploads.
 */

#ifndef UPLOADQUEUE_H
#define UPLOADQUEUE_H

#include <QAbstractListModel>
#include <QHash>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <functional>

#include "uploaditem.h"
#include "services/errorhandler.h"
#include "services/ihttptransport.h"
#include "services/ivideoservice.h"
#include "services/tusuploadsession.h"

class IdleSleepGuard;
class LibraryStore;
class UploadStore;

/**
 * @brief Upload scheduler exposed as a list model.
 *
 * Entries are admitted strictly in creation order, one at a time. The
 * active entry is driven by a TusUploadSession; its signals are the only
 * way an entry reaches Success or Failed. Every durability-relevant change
 * is written through UploadStore right away, so the queue can be restored
 * after a crash and interrupted uploads continue from the server offset.
 *
 * Besides scheduling, the queue keeps the cached remote metadata of its
 * entries up to date (details refresh, processing-ready polling, library
 * reconciliation) and forwards title, thumbnail and delete requests to the
 * video service.
 *
 * @par Example usage:
 * @code
 * UploadQueue *queue = new UploadQueue(this);
 * queue->setHttpTransport(transport);
 * queue->setVideoService(api);
 * queue->setLibraryStore(libraries);
 * queue->setUploadStore(store);
 * queue->load();
 *
 * queue->enqueue({"/videos/a.mp4", "/videos/b.mp4"}, libraryConfigId);
 * @endcode
 */
class UploadQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        FilePathRole,
        FileNameRole,
        TitleRole,
        StatusRole,
        StatusLabelRole,
        ProgressRole,
        SpeedRole,
        EtaRole,
        BytesUploadedRole,
        TotalBytesRole,
        VideoIdRole,
        ErrorMessageRole,
        EncodeProgressRole,
        LibraryConfigIdRole,
        CreatedAtRole
    };

    /// Entries allowed in Uploading at the same time
    static constexpr int MaxConcurrentUploads = 1;
    /// Delay between processing-ready polls
    static constexpr int DefaultPollIntervalMs = 10000;
    /// Polls before giving up on the ready notification
    static constexpr int MaxReadyPolls = 30;
    /// Page size used by syncLibrary()
    static constexpr int SyncPageSize = 100;

    explicit UploadQueue(QObject *parent = nullptr);
    ~UploadQueue() override;

    /// @name Collaborators (not owned)
    /// @{
    void setHttpTransport(IHttpTransport *transport) { transport_ = transport; }
    void setVideoService(IVideoService *service);
    void setLibraryStore(LibraryStore *store) { libraryStore_ = store; }
    void setUploadStore(UploadStore *store) { uploadStore_ = store; }
    void setSleepGuard(IdleSleepGuard *guard) { sleepGuard_ = guard; }
    /// @}

    /// @name Session tuning
    /// @{
    void setTusEndpoint(const QUrl &endpoint) { tusEndpoint_ = endpoint; }
    void setChunkSize(qint64 bytes) { chunkSize_ = bytes; }
    void setRetryPolicy(const TusRetryPolicy &policy) { retryPolicy_ = policy; }
    void setPollIntervalMs(int ms) { pollIntervalMs_ = ms; }
    /// @}

    void setAutoResume(bool enabled) { autoResume_ = enabled; }
    [[nodiscard]] bool autoResume() const { return autoResume_; }

    [[nodiscard]] bool isOnline() const { return online_; }

    /// @name Queue operations
    /// @{

    /**
     * @brief Appends one entry per file for the given library.
     *
     * Without an API key for the library every entry is created as Failed
     * and no request is made.
     *
     * @return Ids of the new entries, in order.
     */
    QStringList enqueue(const QStringList &files, const QString &libraryConfigId);

    /**
     * @brief Starts the oldest Pending entry unless one is already uploading.
     *
     * Safe to call at any time; repeated calls while an entry is uploading
     * change nothing.
     */
    void admitNext();

    void pause(const QString &id);
    void resume(const QString &id);
    void pauseAll();
    void resumeAll();

    /**
     * @brief Stops and removes an entry.
     *
     * Successful uploads and entries without a remote video are removed
     * locally only. Anything else gets one remote delete and is removed once
     * that call returns, whatever its outcome.
     */
    void cancel(const QString &id);

    /// Removes a Success or Failed entry locally; other entries are canceled
    void removeFromHistory(const QString &id);

    /// Stops every session and forgets every entry, without remote calls
    void clearAll();

    /**
     * @brief Restores entries from the UploadStore.
     *
     * With auto-resume on, interrupted and paused entries become Pending and
     * admission runs once. Otherwise stale Uploading entries become Paused.
     */
    void load();
    /// @}

    /// @name Remote metadata
    /// @{

    /**
     * @brief Re-reads the remote details of an entry.
     *
     * A 404 removes the entry locally. Emits videoReady() the first time the
     * encode is reported complete.
     * @return False when the entry has no video or no credentials.
     */
    bool refreshVideoDetails(const QString &id);

    /// Renames the remote video, then refreshes the entry
    bool updateTitle(const QString &id, const QString &title);

    bool uploadThumbnail(const QString &id, const QByteArray &imageData, const QString &mimeType);

    /**
     * @brief Deletes the remote video; the entry is removed only on success.
     *
     * Reports through remoteDeleteFinished().
     */
    void deleteFromRemote(const QString &id);

    /**
     * @brief Reconciles local entries of a library with the remote catalog.
     *
     * Reads every page, refreshes cached metadata of known videos, drops
     * finished entries whose video is gone and adds remote-only videos as
     * Success entries. Reports through librarySynced().
     */
    void syncLibrary(const QString &libraryConfigId);
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] QList<UploadItem> items() const { return items_; }
    [[nodiscard]] UploadItem item(const QString &id) const;
    [[nodiscard]] bool contains(const QString &id) const { return findItemIndex(id) >= 0; }
    [[nodiscard]] int count() const { return items_.size(); }
    [[nodiscard]] int uploadingCount() const;
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] bool hasActiveOrPending() const;
    [[nodiscard]] bool hasSession(const QString &id) const { return sessions_.contains(id); }
    /// @}

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    // For testing: immediately process all pending events
    void flushEventQueue();

public slots:
    /**
     * @brief Reacts to network reachability.
     *
     * Loss pauses the uploading entry; regain resumes paused entries that
     * carry a pause timestamp when auto-resume is on.
     */
    void onConnectivityChanged(bool connected);

signals:
    void queueChanged();
    void itemChanged(const QString &id);
    void uploadStarted(const QString &id);
    void uploadCompleted(const QString &id);
    void uploadPaused(const QString &id, const QString &reason);
    void uploadFailed(const QString &id, ErrorCategory category, const QString &message);
    void itemRemoved(const QString &id);
    void allUploadsFinished();

    /// The remote encode of a finished upload completed (emitted once per entry)
    void videoReady(const QString &id, const QString &title);

    void titleUpdateFinished(const QString &id, bool ok);
    void thumbnailUploadFinished(const QString &id, bool ok);
    void remoteDeleteFinished(const QString &id, bool ok);
    void librarySynced(const QString &libraryConfigId, bool ok);

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private slots:
    void onVideoCreated(const QString &tag, const QString &videoId);
    void onVideoOperationSucceeded(const QString &tag, const QString &operation);
    void onVideoOperationFailed(const QString &tag, const QString &operation, const QString &error);
    void onVideoDetailsReceived(const QString &tag, const VideoDetails &details);
    void onVideoNotFound(const QString &tag);
    void onVideoPageReceived(const QString &tag, const VideoPage &page);

private:
    /// What a tagged video service request was issued for
    struct ApiCall {
        enum Kind {
            Bootstrap,      ///< createVideo of a session detached before the reply
            CancelDelete,
            DiscardVideo,   ///< Delete of a video created for an entry that is gone
            RemoteDelete,
            Refresh,
            ReadyPoll,
            UpdateTitle,
            Thumbnail,
            ListPage
        };
        Kind kind = Refresh;
        QString itemId;
        QString libraryConfigId;
        int attempt = 0;  ///< Poll attempt for ReadyPoll
    };

    struct SyncState {
        QList<VideoDetails> collected;
    };

    void scheduleAdmitNext();   // Defers admitNext() to prevent re-entrancy
    void processEventQueue();   // Processes pending events

    void startItem(int index);
    void restoreCanceled();
    void issueCancelDelete(int index, const LibraryCredentials &creds);
    [[nodiscard]] bool isCreatingVideo(const QString &id) const;
    void detachSession(const QString &id);
    void finishSession(const QString &id);

    void onSessionVideoCreated(TusUploadSession *session, const QString &id, const QString &videoId);
    void onSessionUploadUrlChanged(TusUploadSession *session, const QString &id, const QUrl &url);
    void onSessionProgress(TusUploadSession *session, const QString &id, qint64 acknowledged,
                           qint64 total, const TransferRate &rate);
    void onSessionCompleted(TusUploadSession *session, const QString &id);
    void onSessionPaused(TusUploadSession *session, const QString &id, const QString &reason);
    void onSessionFailed(TusUploadSession *session, const QString &id, ErrorCategory category,
                         const QString &message);
    [[nodiscard]] int activeIndexFor(TusUploadSession *session, const QString &id) const;

    QString issueCall(const ApiCall &call);
    [[nodiscard]] LibraryCredentials credentialsFor(const UploadItem &item) const;
    void requestDetails(const QString &id, ApiCall::Kind kind, int attempt = 0);
    void scheduleReadyPoll(const QString &id, int attempt, int delayMs);
    void applyDetails(int index, const VideoDetails &details);
    void requestPage(const QString &libraryConfigId, int page);
    void mergeLibrary(const QString &libraryConfigId, const QList<VideoDetails> &remote);

    void removeItemAt(int index);
    void removeItem(const QString &id);
    void notifyRowChanged(int index);
    void persist();
    void updateSleepGuard();
    void checkAllFinished();

    [[nodiscard]] int findItemIndex(const QString &id) const;
    [[nodiscard]] int findOldestPending() const;  // Oldest createdAt, ties by id

    QPointer<IHttpTransport> transport_;
    QPointer<IVideoService> videoService_;
    LibraryStore *libraryStore_ = nullptr;
    UploadStore *uploadStore_ = nullptr;
    IdleSleepGuard *sleepGuard_ = nullptr;

    QUrl tusEndpoint_;
    qint64 chunkSize_ = TusUploadSession::DefaultChunkSize;
    TusRetryPolicy retryPolicy_;
    int pollIntervalMs_ = DefaultPollIntervalMs;
    bool autoResume_ = true;
    bool online_ = true;

    QList<UploadItem> items_;
    QHash<QString, TusUploadSession*> sessions_;  // Entry id -> active session
    QHash<QString, ApiCall> apiCalls_;            // Request tag -> purpose
    QHash<QString, SyncState> syncs_;             // Library config id -> running sync
    quint64 nextTag_ = 1;

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;  // Re-entrancy guard
    bool eventProcessingScheduled_ = false;  // Prevents multiple timer posts
};

#endif // UPLOADQUEUE_H
