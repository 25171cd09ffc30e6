/**
 * @file streamapiclient.h
 * @brief REST client for the Bunny Stream video API.
 *
 * Provides the video registry calls the upload engine and the library
 * browser need: create, delete, inspect, retitle and list videos.
 */

#ifndef STREAMAPICLIENT_H
#define STREAMAPICLIENT_H

#include <QHash>
#include <QJsonObject>
#include <QString>

#include "ihttptransport.h"
#include "ivideoservice.h"

/**
 * @brief IVideoService implementation speaking HTTPS + JSON.
 *
 * Requests go through an injected IHttpTransport, so tests can drive the
 * client with a scripted transport. Every request carries the library key
 * in the AccessKey header.
 *
 * @par Example usage:
 * @code
 * StreamApiClient *api = new StreamApiClient(transport, this);
 * connect(api, &IVideoService::videoCreated, this, &MyClass::onCreated);
 * api->createVideo("item-1", credentials, "Holiday", QString());
 * @endcode
 */
class StreamApiClient : public IVideoService
{
    Q_OBJECT

public:
    /// Production API host
    static constexpr const char *DefaultBaseUrl = "https://video.bunnycdn.com";
    /// Maximum characters to include from error response body
    static constexpr int ErrorResponsePreviewLength = 200;

    /**
     * @brief Constructs a client.
     * @param transport HTTP transport (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit StreamApiClient(IHttpTransport *transport, QObject *parent = nullptr);
    ~StreamApiClient() override;

    /**
     * @brief Overrides the API host, e.g. for a staging environment.
     * @param baseUrl Scheme and host; a trailing slash is removed.
     */
    void setBaseUrl(const QString &baseUrl);
    [[nodiscard]] QString baseUrl() const { return baseUrl_; }

    void createVideo(const QString &tag, const LibraryCredentials &credentials,
                     const QString &title, const QString &collectionId) override;
    void deleteVideo(const QString &tag, const LibraryCredentials &credentials,
                     const QString &videoId) override;
    void fetchVideoDetails(const QString &tag, const LibraryCredentials &credentials,
                           const QString &videoId) override;
    void updateVideoTitle(const QString &tag, const LibraryCredentials &credentials,
                          const QString &videoId, const QString &title) override;
    void uploadThumbnail(const QString &tag, const LibraryCredentials &credentials,
                         const QString &videoId, const QByteArray &imageData,
                         const QString &mimeType) override;
    void listVideos(const QString &tag, const LibraryCredentials &credentials,
                    int page, int perPage) override;
    void listCollections(const QString &tag, const LibraryCredentials &credentials) override;

    /**
     * @brief Parses one video object of the API.
     *
     * Accepts the key variants the service has used over time for the
     * thumbnail, encode progress, duration and upload date.
     */
    [[nodiscard]] static VideoDetails parseVideo(const QJsonObject &json);

    /**
     * @brief Parses a paged listing ("items", "totalItems", ...).
     */
    [[nodiscard]] static VideoPage parseVideoPage(const QJsonObject &json, int requestedPage);

private slots:
    void onRequestFinished(quint64 requestId, const HttpResponse &response);

private:
    struct PendingOperation {
        QString tag;
        QString operation;
        int page = 1;  ///< Requested page for listVideos
    };

    HttpRequest createRequest(const QByteArray &method, const QString &endpoint,
                              const LibraryCredentials &credentials) const;
    void sendRequest(const HttpRequest &request, const QString &tag,
                     const QString &operation, int page = 1);
    [[nodiscard]] static QString libraryPath(const LibraryCredentials &credentials);
    [[nodiscard]] static QString extractError(const HttpResponse &response);

    void handleCreateResponse(const PendingOperation &op, const QJsonObject &json);
    void handleCollectionsResponse(const PendingOperation &op, const QJsonObject &json);

    IHttpTransport *transport_ = nullptr;
    QString baseUrl_;
    QHash<quint64, PendingOperation> pendingOperations_;
};

#endif // STREAMAPICLIENT_H
