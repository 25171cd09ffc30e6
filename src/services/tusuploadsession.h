/**
 * @file tusuploadsession.h
 * @brief Resumable chunked upload of one file using the tus 1.0 protocol.
 */

#ifndef TUSUPLOADSESSION_H
#define TUSUPLOADSESSION_H

#include <QElapsedTimer>
#include <QList>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

#include "errorhandler.h"
#include "ihttptransport.h"
#include "ivideoservice.h"
#include "../utils/transferrate.h"

/**
 * @brief Delays used by a session when a request does not go as expected.
 */
struct TusRetryPolicy {
    /// Delay before retry N of a stage; a stage fails once all are used
    QList<int> backoffMs{0, 1000, 2000, 5000, 5000, 10000, 30000};
    /// Delay before repeating a route probe that hit a network error
    int probeRetryMs = 1000;
    /// Delay before re-reading the offset after a 423 Locked answer
    int lockedRetryMs = 1000;
};

/**
 * @brief What a session needs to know about the file and its target.
 *
 * When both videoId and uploadUrl are set the session skips bootstrap and
 * continues the existing tus upload from the server's offset.
 */
struct TusUploadParams {
    QString filePath;
    QString libraryId;
    QString apiKey;
    QString title;         ///< Title for a newly created video
    QString collectionId;  ///< Optional collection for a newly created video
    QString videoId;       ///< Existing remote video, empty to create one
    QUrl uploadUrl;        ///< Existing tus upload URL, empty to create one
};

/**
 * @brief Single-use state machine driving one tus upload.
 *
 * The session bootstraps the remote video and the tus upload resource when
 * needed, then repeats probe, offset discovery and chunk transfer until the
 * server has acknowledged every byte. It ends with exactly one of
 * completed(), paused() or failed(), unless abort() is called first, after
 * which it emits nothing.
 *
 * Network-loss errors end the session with paused() instead of failing it.
 * Unexpected responses are retried per stage following TusRetryPolicy, and
 * a 423 Locked answer is waited out without touching the retry budget.
 *
 * @par Example usage:
 * @code
 * auto *session = new TusUploadSession(transport, videoService, this);
 * connect(session, &TusUploadSession::uploadUrlChanged, this, &MyClass::persistUrl);
 * connect(session, &TusUploadSession::completed, this, &MyClass::onDone);
 *
 * TusUploadParams params;
 * params.filePath = "/videos/clip.mp4";
 * params.libraryId = "12345";
 * params.apiKey = apiKey;
 * params.title = "clip.mp4";
 * session->start(params);
 * @endcode
 */
class TusUploadSession : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,           ///< Not started
        Bootstrapping,  ///< Creating the video and/or the tus upload
        Transferring,   ///< Probing, reading offsets and sending chunks
        Done,           ///< Every byte acknowledged
        Paused,         ///< Stopped by abort() or network loss
        Failed          ///< Terminal error
    };
    Q_ENUM(State)

    /// Bytes sent per PATCH request
    static constexpr qint64 DefaultChunkSize = 4 * 1024 * 1024;
    /// tus creation endpoint of the video service
    static constexpr const char *DefaultEndpoint = "https://video.bunnycdn.com/tusupload";
    /// Lifetime of the upload signature
    static constexpr qint64 SignatureLifetimeSecs = 6 * 60 * 60;

    /**
     * @brief Constructs a session.
     * @param transport HTTP transport for tus requests (not owned).
     * @param videoService Registry used to create the remote video (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    TusUploadSession(IHttpTransport *transport, IVideoService *videoService,
                     QObject *parent = nullptr);
    ~TusUploadSession() override;

    void setEndpoint(const QUrl &endpoint) { endpoint_ = endpoint; }
    [[nodiscard]] QUrl endpoint() const { return endpoint_; }

    void setChunkSize(qint64 bytes) { chunkSize_ = qMax<qint64>(bytes, 1); }
    [[nodiscard]] qint64 chunkSize() const { return chunkSize_; }

    void setRetryPolicy(const TusRetryPolicy &policy) { policy_ = policy; }
    [[nodiscard]] TusRetryPolicy retryPolicy() const { return policy_; }

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] QString videoId() const { return videoId_; }
    [[nodiscard]] QUrl uploadUrl() const { return uploadUrl_; }
    [[nodiscard]] qint64 acknowledgedBytes() const { return acknowledged_; }
    [[nodiscard]] qint64 totalBytes() const { return totalBytes_; }

    /**
     * @brief Starts the upload. Only the first call has an effect.
     */
    void start(const TusUploadParams &params);

    /**
     * @brief Stops the session at once.
     *
     * The in-flight request is aborted, pending timers become no-ops and no
     * further signal is emitted. The remote video and tus upload are kept so
     * a later session can resume them.
     */
    void abort();

    [[nodiscard]] bool isAborted() const { return aborted_; }

    /// True while the createVideo() request of this session has not been answered
    [[nodiscard]] bool isCreatingVideo() const { return creatingVideo_; }
    /// Tag the session uses for its video service requests
    [[nodiscard]] QString serviceTag() const { return serviceTag_; }

    /**
     * @brief Hex SHA-256 of libraryId + apiKey + expire + videoId.
     */
    [[nodiscard]] static QByteArray computeSignature(const QString &libraryId,
                                                     const QString &apiKey,
                                                     qint64 expire,
                                                     const QString &videoId);

    /// Upload-Metadata value announcing the file name
    [[nodiscard]] static QByteArray encodeMetadata(const QString &fileName);

    /// Resolves a Location header against the creation endpoint
    [[nodiscard]] static QUrl resolveLocation(const QByteArray &location, const QUrl &endpoint);

signals:
    /**
     * @brief Emitted once the remote video exists.
     * @param videoId Id assigned by the video service.
     */
    void videoCreated(const QString &videoId);

    /**
     * @brief Emitted as soon as the tus upload resource exists.
     *
     * Fired before the first chunk so the URL can be persisted and a crash
     * after this point still resumes the same upload.
     */
    void uploadUrlChanged(const QUrl &url);

    /**
     * @brief Emitted after every offset the server acknowledged.
     * @param acknowledged Bytes the server holds.
     * @param total File size.
     * @param rate Throughput and ETA for this session.
     */
    void progressChanged(qint64 acknowledged, qint64 total, const TransferRate &rate);

    /// Every byte was acknowledged
    void completed();

    /**
     * @brief The network went away; the upload can be resumed later.
     * @param reason Transport error text.
     */
    void paused(const QString &reason);

    /**
     * @brief The upload cannot continue.
     * @param category ResourceBootstrap, Protocol or LocalFile.
     * @param message Human-readable reason.
     */
    void failed(ErrorCategory category, const QString &message);

private slots:
    void onRequestFinished(quint64 requestId, const HttpResponse &response);
    void onVideoCreated(const QString &tag, const QString &videoId);
    void onVideoOperationFailed(const QString &tag, const QString &operation,
                                const QString &error);

private:
    enum class Stage { None, Create, Probe, Head, Patch };

    void prepareSignature();
    void applyTusHeaders(HttpRequest &request) const;
    void send(Stage stage, HttpRequest request);

    void createUpload();
    void beginTransfer();
    void probeRoute();
    void discoverOffset();
    void sendChunk(qint64 offset);

    void handleCreateResponse(const HttpResponse &response);
    void handleProbeResponse(const HttpResponse &response);
    void handleHeadResponse(const HttpResponse &response);
    void handlePatchResponse(const HttpResponse &response);

    void retryOrFail(const char *stageName, int &attempt, const QString &reason,
                     const std::function<void()> &action);
    void schedule(int delayMs, const std::function<void()> &action);
    void reportProgress();

    void finishCompleted();
    void finishPaused(const QString &reason);
    void finishFailed(ErrorCategory category, const QString &message);
    [[nodiscard]] bool isFinished() const;

    [[nodiscard]] static QString describe(const HttpResponse &response);

    IHttpTransport *transport_ = nullptr;
    IVideoService *videoService_ = nullptr;

    QUrl endpoint_;
    qint64 chunkSize_ = DefaultChunkSize;
    TusRetryPolicy policy_;

    State state_ = State::Idle;
    bool aborted_ = false;
    bool creatingVideo_ = false;

    TusUploadParams params_;
    QString serviceTag_;
    QString videoId_;
    QUrl uploadUrl_;
    QByteArray signature_;
    qint64 expire_ = 0;

    qint64 totalBytes_ = 0;
    qint64 acknowledged_ = 0;
    qint64 sessionStartOffset_ = -1;
    QElapsedTimer elapsed_;

    quint64 currentRequestId_ = 0;
    Stage currentStage_ = Stage::None;
    qint64 chunkOffset_ = 0;
    qint64 chunkLength_ = 0;

    int createAttempt_ = 0;
    int headAttempt_ = 0;
    int patchAttempt_ = 0;
};

#endif // TUSUPLOADSESSION_H
