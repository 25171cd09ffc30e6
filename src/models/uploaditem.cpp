#include "uploaditem.h"
#include "../utils/jsonfields.h"

#include <QDebug>
#include <QFileInfo>
#include <QUrl>
#include <QUuid>

UploadStatus uploadStatusFromString(const QString &value)
{
    const QString v = value.trimmed().toLower();
    if (v == "uploading") return UploadStatus::Uploading;
    if (v == "paused") return UploadStatus::Paused;
    if (v == "success") return UploadStatus::Success;
    if (v == "failed") return UploadStatus::Failed;
    if (v == "canceled" || v == "cancelled") return UploadStatus::Canceled;
    return UploadStatus::Pending;
}

QString uploadStatusLabel(UploadStatus status)
{
    switch (status) {
    case UploadStatus::Uploading:
    case UploadStatus::Pending:
        return QStringLiteral("Uploading");
    case UploadStatus::Paused:
        return QStringLiteral("Paused");
    case UploadStatus::Success:
        return QStringLiteral("Ready");
    case UploadStatus::Failed:
        return QStringLiteral("Failed");
    case UploadStatus::Canceled:
        return QStringLiteral("Canceled");
    }
    return QString();
}

UploadItem UploadItem::create(const QString &filePath,
                              const QString &libraryConfigId,
                              const QString &libraryId,
                              UploadStatus status)
{
    UploadItem item;
    item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    item.filePath = filePath;
    item.createdAt = QDateTime::currentDateTimeUtc();
    item.libraryConfigId = libraryConfigId;
    item.libraryId = libraryId;
    item.status = status;
    return item;
}

QString UploadItem::fileName() const
{
    return QFileInfo(filePath).fileName();
}

QString UploadItem::displayTitle() const
{
    return remoteTitle.isEmpty() ? fileName() : remoteTitle;
}

QString UploadItem::etaFormatted() const
{
    if (etaSeconds <= 0) {
        return QString::fromUtf8("—");
    }
    const qint64 s = static_cast<qint64>(etaSeconds);
    if (s < 60) {
        return QString("%1s").arg(s);
    }
    if (s < 3600) {
        return QString("%1m %2s").arg(s / 60).arg(s % 60);
    }
    return QString("%1h %2m").arg(s / 3600).arg((s % 3600) / 60);
}

QJsonObject UploadItem::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["file"] = QUrl::fromLocalFile(filePath).toString();
    json["createdAt"] = JsonFields::dateToJson(createdAt);

    json["libraryConfigId"] = libraryConfigId;
    json["libraryId"] = libraryId;
    if (!collectionId.isEmpty()) {
        json["collectionId"] = collectionId;
    }

    json["status"] = QString::fromLatin1(uploadStatusToString(status));
    json["progress"] = progress;
    json["speedMBps"] = speedMBps;
    json["etaSeconds"] = etaSeconds;

    if (!videoId.isEmpty()) json["videoId"] = videoId;
    if (!errorMessage.isEmpty()) json["errorMessage"] = errorMessage;
    if (completedAt.isValid()) json["completedAt"] = JsonFields::dateToJson(completedAt);
    if (!remoteTitle.isEmpty()) json["remoteTitle"] = remoteTitle;
    if (!remoteDescription.isEmpty()) json["remoteDescription"] = remoteDescription;
    if (!remoteThumbnailPath.isEmpty()) json["remoteThumbnailPath"] = remoteThumbnailPath;
    if (remoteStatusCode >= 0) json["remoteStatusCode"] = remoteStatusCode;
    if (remoteEncodeProgress >= 0) json["remoteEncodeProgress"] = remoteEncodeProgress;
    if (remoteDurationSeconds >= 0) json["remoteDurationSeconds"] = remoteDurationSeconds;
    json["processingReadyNotified"] = processingReadyNotified;

    if (!tusUploadUrl.isEmpty()) json["tusUploadURL"] = tusUploadUrl;
    json["bytesUploaded"] = bytesUploaded;
    json["totalBytes"] = totalBytes;
    if (lastResumeAttempt.isValid()) {
        json["lastResumeAttempt"] = JsonFields::dateToJson(lastResumeAttempt);
    }
    return json;
}

namespace {

// The file reference has been stored as a file:// URL string, a bare path,
// and as an object wrapping the URL.
QString filePathFrom(const QJsonValue &value)
{
    QString raw;
    if (value.isString()) {
        raw = value.toString();
    } else if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        raw = JsonFields::firstString(obj, {"relative", "path", "url"});
    }
    if (raw.isEmpty()) {
        return QString();
    }

    const QUrl url(raw);
    if (url.isLocalFile()) {
        return url.toLocalFile();
    }
    if (url.scheme().isEmpty()) {
        return raw;
    }
    return QString();
}

} // namespace

UploadItem UploadItem::fromJson(const QJsonObject &json, bool *ok)
{
    UploadItem item;

    item.id = JsonFields::firstIdentifier(json, {"id"});
    if (item.id.isEmpty()) {
        item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    item.filePath = filePathFrom(json.value("file"));
    if (item.filePath.isEmpty()) {
        item.filePath = JsonFields::firstString(json, {"filePath", "path"});
    }
    if (ok) {
        *ok = !item.filePath.isEmpty();
    }

    item.createdAt = JsonFields::firstDate(json, {"createdAt"});
    if (!item.createdAt.isValid()) {
        item.createdAt = QDateTime::currentDateTimeUtc();
    }

    item.libraryConfigId = JsonFields::firstIdentifier(json, {"libraryConfigId", "libraryConfigUUID"});
    item.libraryId = JsonFields::firstIdentifier(json, {"libraryId", "libraryUUID"});
    item.collectionId = JsonFields::firstIdentifier(json, {"collectionId"});

    item.status = uploadStatusFromString(json.value("status").toString());
    item.progress = qBound(0.0, JsonFields::firstNumber(json, {"progress"}, 0.0), 1.0);
    item.speedMBps = JsonFields::firstNumber(json, {"speedMBps"}, 0.0);
    item.etaSeconds = JsonFields::firstNumber(json, {"etaSeconds"}, 0.0);

    item.videoId = JsonFields::firstIdentifier(json, {"videoId", "guid"});
    item.errorMessage = JsonFields::firstString(json, {"errorMessage"});
    item.completedAt = JsonFields::firstDate(json, {"completedAt"});
    item.remoteTitle = JsonFields::firstString(json, {"remoteTitle"});
    item.remoteDescription = JsonFields::firstString(json, {"remoteDescription"});
    item.remoteThumbnailPath = JsonFields::firstString(json, {"remoteThumbnailPath"});
    item.remoteStatusCode = static_cast<int>(JsonFields::firstInteger(json, {"remoteStatusCode"}, -1));
    item.remoteEncodeProgress = JsonFields::firstNumber(json, {"remoteEncodeProgress"}, -1.0);
    item.remoteDurationSeconds = JsonFields::firstNumber(json, {"remoteDurationSeconds"}, -1.0);
    item.processingReadyNotified = JsonFields::boolValue(json, "processingReadyNotified", false);

    item.tusUploadUrl = JsonFields::firstString(json, {"tusUploadURL", "tusUploadUrl"});
    item.bytesUploaded = JsonFields::firstInteger(json, {"bytesUploaded"}, 0);
    item.totalBytes = JsonFields::firstInteger(json, {"totalBytes"}, 0);
    item.lastResumeAttempt = JsonFields::firstDate(json, {"lastResumeAttempt"});

    return item;
}

QJsonArray uploadItemsToJson(const QList<UploadItem> &items)
{
    QJsonArray array;
    for (const UploadItem &item : items) {
        array.append(item.toJson());
    }
    return array;
}

QList<UploadItem> uploadItemsFromJson(const QJsonArray &array)
{
    QList<UploadItem> items;
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            qWarning() << "UploadItem: skipping non-object entry in persisted queue";
            continue;
        }
        bool ok = false;
        UploadItem item = UploadItem::fromJson(value.toObject(), &ok);
        if (!ok) {
            qWarning() << "UploadItem: skipping entry" << item.id << "without a file reference";
            continue;
        }
        items.append(item);
    }
    return items;
}
