#include "uploadstore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

UploadStore::UploadStore(const QString &filePath)
    : filePath_(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString UploadStore::defaultFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return dataDir + "/" + FileName;
}

bool UploadStore::save(const QList<UploadItem> &items) const
{
    QDir dir = QFileInfo(filePath_).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        qWarning() << "UploadStore: cannot create directory" << dir.absolutePath();
        return false;
    }

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "UploadStore: cannot open" << filePath_ << file.errorString();
        return false;
    }

    const QJsonDocument doc(uploadItemsToJson(items));
    if (file.write(doc.toJson(QJsonDocument::Indented)) == -1) {
        qWarning() << "UploadStore: write failed" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qWarning() << "UploadStore: commit failed" << file.errorString();
        return false;
    }
    return true;
}

QList<UploadItem> UploadStore::load() const
{
    QFile file(filePath_);
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "UploadStore: cannot read" << filePath_ << file.errorString();
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "UploadStore: ignoring corrupt snapshot:" << parseError.errorString();
        return {};
    }

    // Early builds wrapped the list in an object
    if (doc.isObject()) {
        const QJsonObject root = doc.object();
        if (root.value("items").isArray()) {
            return uploadItemsFromJson(root.value("items").toArray());
        }
        qWarning() << "UploadStore: snapshot has no item list";
        return {};
    }

    if (!doc.isArray()) {
        return {};
    }
    return uploadItemsFromJson(doc.array());
}
