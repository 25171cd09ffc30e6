/**
 * @file uploaditem.h
 * @brief Queue entry for a single file upload and its persisted form.
 */

#ifndef UPLOADITEM_H
#define UPLOADITEM_H

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

enum class UploadStatus { Pending, Uploading, Paused, Success, Failed, Canceled };

/// @brief Convert UploadStatus to its persisted string form
[[nodiscard]] inline const char* uploadStatusToString(UploadStatus status) {
    switch (status) {
        case UploadStatus::Pending: return "pending";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Paused: return "paused";
        case UploadStatus::Success: return "success";
        case UploadStatus::Failed: return "failed";
        case UploadStatus::Canceled: return "canceled";
    }
    return "pending";
}

/// @brief Parse a persisted status string; unknown values map to Pending
[[nodiscard]] UploadStatus uploadStatusFromString(const QString &value);

/// @brief User-facing bucket for a status ("Uploading", "Paused", "Ready", ...)
[[nodiscard]] QString uploadStatusLabel(UploadStatus status);

/**
 * @brief One file queued for upload to a remote video library.
 *
 * Remote metadata fields are an advisory cache refreshed from the video
 * service; they never drive the local status. Numeric cache fields use -1
 * for "not known".
 */
struct UploadItem {
    QString id;
    QString filePath;
    QDateTime createdAt;

    // Target
    QString libraryConfigId;  // Local library configuration
    QString libraryId;        // Remote library identifier
    QString collectionId;     // Empty for none

    // Status and telemetry
    UploadStatus status = UploadStatus::Pending;
    double progress = 0.0;
    double speedMBps = 0.0;
    double etaSeconds = 0.0;

    // Result
    QString videoId;
    QString errorMessage;
    QDateTime completedAt;
    QString remoteTitle;
    QString remoteDescription;
    QString remoteThumbnailPath;
    int remoteStatusCode = -1;
    double remoteEncodeProgress = -1.0;
    double remoteDurationSeconds = -1.0;
    bool processingReadyNotified = false;

    // Resume support
    QString tusUploadUrl;
    qint64 bytesUploaded = 0;
    qint64 totalBytes = 0;
    QDateTime lastResumeAttempt;

    /**
     * @brief Creates a new entry with a fresh id and creation time.
     * @param filePath Local file to upload.
     * @param libraryConfigId Local library configuration id.
     * @param libraryId Remote library id.
     * @param status Initial status.
     */
    [[nodiscard]] static UploadItem create(const QString &filePath,
                                           const QString &libraryConfigId,
                                           const QString &libraryId,
                                           UploadStatus status = UploadStatus::Pending);

    [[nodiscard]] bool hasVideo() const { return !videoId.isEmpty(); }
    [[nodiscard]] bool canResumeTransfer() const { return hasVideo() && !tusUploadUrl.isEmpty(); }
    [[nodiscard]] bool isTerminal() const {
        return status == UploadStatus::Success || status == UploadStatus::Failed
               || status == UploadStatus::Canceled;
    }
    [[nodiscard]] bool isActiveOrPending() const {
        return status == UploadStatus::Uploading || status == UploadStatus::Pending;
    }

    [[nodiscard]] QString fileName() const;

    /// Remote title when known, otherwise the local file name
    [[nodiscard]] QString displayTitle() const;

    /// Remaining time as "—", "42s", "3m 5s" or "1h 2m"
    [[nodiscard]] QString etaFormatted() const;

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief Decodes an entry, tolerating legacy field names and shapes.
     * @param json The persisted object.
     * @param ok Set to false when no usable file reference was found.
     */
    [[nodiscard]] static UploadItem fromJson(const QJsonObject &json, bool *ok = nullptr);
};

/// @name List helpers
/// @{
[[nodiscard]] QJsonArray uploadItemsToJson(const QList<UploadItem> &items);
[[nodiscard]] QList<UploadItem> uploadItemsFromJson(const QJsonArray &array);
/// @}

#endif // UPLOADITEM_H
