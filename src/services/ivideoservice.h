/**
 * @file ivideoservice.h
 * @brief Interface for the remote video registry (Stream REST API).
 *
 * This interface allows dependency injection of the video service, enabling
 * runtime swapping between the HTTP client and a mock for testing.
 */

#ifndef IVIDEOSERVICE_H
#define IVIDEOSERVICE_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QObject>
#include <QString>

/**
 * @brief Credentials of one remote library.
 */
struct LibraryCredentials {
    QString libraryId;  ///< Remote library id
    QString apiKey;     ///< Sent as the AccessKey header; never logged

    [[nodiscard]] bool isValid() const { return !libraryId.isEmpty() && !apiKey.isEmpty(); }
};

/**
 * @brief Remote metadata of a single video.
 */
struct VideoDetails {
    QString videoId;
    QString title;
    QString description;
    QString thumbnailFileName;  ///< Empty when the service reports none
    int statusCode = -1;        ///< Remote processing status, -1 when absent
    double encodeProgress = -1.0;   ///< 0..100, -1 when absent
    double durationSeconds = -1.0;  ///< -1 when absent
    QDateTime createdAt;        ///< Upload date as reported by the service

    /// True once the service reports the encode as complete
    [[nodiscard]] bool isReady() const { return encodeProgress >= 100.0; }
};

/**
 * @brief One page of a library listing.
 */
struct VideoPage {
    QList<VideoDetails> items;
    int totalItems = 0;
    int itemsPerPage = 0;
    int currentPage = 1;

    /// True when pages after this one exist
    [[nodiscard]] bool hasMore() const
    {
        if (items.isEmpty() || itemsPerPage <= 0) {
            return false;
        }
        return currentPage * itemsPerPage < totalItems;
    }
};

/**
 * @brief A video collection inside a library.
 */
struct CollectionInfo {
    QString id;
    QString name;
};

/**
 * @brief Abstract interface for the remote video registry.
 *
 * Every call carries a caller-chosen tag that is echoed in the result
 * signals, so several callers can share one service instance. Each call
 * ends with exactly one result signal (or videoNotFound()) or one
 * operationFailed().
 *
 * @par Example usage:
 * @code
 * IVideoService *api = new StreamApiClient(http, this);
 *
 * connect(api, &IVideoService::videoCreated, this,
 *         [](const QString &tag, const QString &videoId) { ... });
 * connect(api, &IVideoService::operationFailed, this, &MyClass::onFailed);
 *
 * api->createVideo("item-1", {"12345", apiKey}, "Holiday", QString());
 * @endcode
 */
class IVideoService : public QObject
{
    Q_OBJECT

public:
    /// @name Operation names reported in operationSucceeded/operationFailed
    /// @{
    static constexpr const char *OpCreateVideo = "createVideo";
    static constexpr const char *OpDeleteVideo = "deleteVideo";
    static constexpr const char *OpFetchDetails = "fetchDetails";
    static constexpr const char *OpUpdateTitle = "updateTitle";
    static constexpr const char *OpUploadThumbnail = "uploadThumbnail";
    static constexpr const char *OpListVideos = "listVideos";
    static constexpr const char *OpListCollections = "listCollections";
    /// @}

    explicit IVideoService(QObject *parent = nullptr) : QObject(parent) {}
    ~IVideoService() override = default;

    /**
     * @brief Registers a new video and returns its id via videoCreated().
     * @param collectionId Optional collection; empty for none.
     */
    virtual void createVideo(const QString &tag, const LibraryCredentials &credentials,
                             const QString &title, const QString &collectionId) = 0;

    /**
     * @brief Deletes a video. Reports operationSucceeded(tag, OpDeleteVideo).
     */
    virtual void deleteVideo(const QString &tag, const LibraryCredentials &credentials,
                             const QString &videoId) = 0;

    /**
     * @brief Fetches video metadata.
     *
     * Emits videoDetailsReceived(), or videoNotFound() when the service
     * answers 404.
     */
    virtual void fetchVideoDetails(const QString &tag, const LibraryCredentials &credentials,
                                   const QString &videoId) = 0;

    /**
     * @brief Changes the video title. Reports operationSucceeded(tag, OpUpdateTitle).
     */
    virtual void updateVideoTitle(const QString &tag, const LibraryCredentials &credentials,
                                  const QString &videoId, const QString &title) = 0;

    /**
     * @brief Replaces the video thumbnail with an image.
     */
    virtual void uploadThumbnail(const QString &tag, const LibraryCredentials &credentials,
                                 const QString &videoId, const QByteArray &imageData,
                                 const QString &mimeType) = 0;

    /**
     * @brief Lists one page of the library. Emits videoPageReceived().
     * @param page 1-based page number.
     */
    virtual void listVideos(const QString &tag, const LibraryCredentials &credentials,
                            int page, int perPage) = 0;

    /**
     * @brief Lists the collections of the library. Emits collectionsReceived().
     */
    virtual void listCollections(const QString &tag, const LibraryCredentials &credentials) = 0;

signals:
    void videoCreated(const QString &tag, const QString &videoId);
    void videoDetailsReceived(const QString &tag, const VideoDetails &details);
    void videoNotFound(const QString &tag);
    void videoPageReceived(const QString &tag, const VideoPage &page);
    void collectionsReceived(const QString &tag, const QList<CollectionInfo> &collections);

    /**
     * @brief Emitted when an operation without a dedicated result signal succeeds.
     * @param operation One of the Op* names.
     */
    void operationSucceeded(const QString &tag, const QString &operation);

    /**
     * @brief Emitted when any operation fails.
     * @param operation One of the Op* names.
     * @param error Human-readable error text.
     */
    void operationFailed(const QString &tag, const QString &operation, const QString &error);
};

#endif // IVIDEOSERVICE_H
