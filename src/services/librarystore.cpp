/**
 * @file librarystore.cpp
 * @brief Implementation of the LibraryStore service.
 */

#include "librarystore.h"
#include "credentialstore.h"
#include "streamapiclient.h"
#include "tusuploadsession.h"
#include "../utils/jsonfields.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QUuid>

#include <memory>

QJsonObject LibraryConfig::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["name"] = name;
    json["libraryId"] = libraryId;
    if (!pullZoneHost.isEmpty()) {
        json["pullZoneHost"] = pullZoneHost;
    }
    return json;
}

LibraryConfig LibraryConfig::fromJson(const QJsonObject &json)
{
    LibraryConfig config;
    config.id = JsonFields::firstIdentifier(json, {"id", "uuid"});
    config.name = json.value("name").toString();
    config.libraryId = JsonFields::firstIdentifier(json, {"libraryId", "libraryID"});
    config.pullZoneHost = JsonFields::firstString(json, {"pullZoneHost", "pullZone"});
    return config;
}

LibraryStore::LibraryStore(QObject *parent)
    : QObject(parent)
{
    loadSettings();
}

int LibraryStore::indexOf(const QString &configId) const
{
    for (int i = 0; i < libraries_.size(); ++i) {
        if (libraries_.at(i).id == configId) {
            return i;
        }
    }
    return -1;
}

bool LibraryStore::contains(const QString &configId) const
{
    return indexOf(configId) >= 0;
}

LibraryConfig LibraryStore::library(const QString &configId) const
{
    const int idx = indexOf(configId);
    return idx >= 0 ? libraries_.at(idx) : LibraryConfig();
}

QString LibraryStore::addLibrary(const QString &name, const QString &libraryId,
                                 const QString &apiKey, const QString &pullZoneHost)
{
    if (name.trimmed().isEmpty() || libraryId.trimmed().isEmpty()) {
        return QString();
    }

    LibraryConfig config;
    config.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    config.name = name.trimmed();
    config.libraryId = libraryId.trimmed();
    config.pullZoneHost = pullZoneHost.trimmed();

    libraries_.append(config);
    saveSettings();

    if (!apiKey.isEmpty() && !CredentialStore::storeApiKey(config.id, apiKey)) {
        qWarning() << "LibraryStore: could not store API key for" << config.name;
    }

    emit librariesChanged();
    return config.id;
}

bool LibraryStore::renameLibrary(const QString &configId, const QString &name)
{
    const int idx = indexOf(configId);
    if (idx < 0 || name.trimmed().isEmpty()) {
        return false;
    }

    libraries_[idx].name = name.trimmed();
    saveSettings();
    emit librariesChanged();
    return true;
}

bool LibraryStore::removeLibrary(const QString &configId)
{
    const int idx = indexOf(configId);
    if (idx < 0) {
        return false;
    }

    libraries_.removeAt(idx);
    collections_.remove(configId);
    CredentialStore::deleteApiKey(configId);

    QSettings settings;
    settings.remove(QString("%1/%2").arg(QLatin1String(DefaultCollectionsGroup), configId));
    if (settings.value(LastSelectedKey).toString() == configId) {
        settings.remove(LastSelectedKey);
    }

    saveSettings();
    emit librariesChanged();
    return true;
}

QString LibraryStore::apiKey(const QString &configId) const
{
    if (configId.isEmpty()) {
        return QString();
    }
    return CredentialStore::apiKey(configId);
}

bool LibraryStore::setApiKey(const QString &configId, const QString &apiKey)
{
    if (!contains(configId)) {
        return false;
    }
    if (apiKey.isEmpty()) {
        return CredentialStore::deleteApiKey(configId);
    }
    return CredentialStore::storeApiKey(configId, apiKey);
}

LibraryCredentials LibraryStore::credentials(const QString &configId) const
{
    const LibraryConfig config = library(configId);
    if (!config.isValid()) {
        return LibraryCredentials();
    }
    return LibraryCredentials{config.libraryId, apiKey(configId)};
}

QString LibraryStore::defaultCollection(const QString &configId) const
{
    QSettings settings;
    return settings.value(QString("%1/%2").arg(QLatin1String(DefaultCollectionsGroup), configId))
        .toString();
}

void LibraryStore::setDefaultCollection(const QString &configId, const QString &collectionId)
{
    QSettings settings;
    const QString key = QString("%1/%2").arg(QLatin1String(DefaultCollectionsGroup), configId);
    if (collectionId.isEmpty()) {
        settings.remove(key);
    } else {
        settings.setValue(key, collectionId);
    }
}

void LibraryStore::refreshCollections(const QString &configId, IVideoService *service)
{
    const LibraryCredentials creds = credentials(configId);
    if (!creds.isValid() || !service) {
        return;
    }

    const QString tag = QStringLiteral("collections:") + configId;

    // One-shot handlers; both disconnect once the tagged reply arrives
    auto received = std::make_shared<QMetaObject::Connection>();
    auto failedConn = std::make_shared<QMetaObject::Connection>();
    *received = connect(service, &IVideoService::collectionsReceived, this,
                        [this, tag, configId, received, failedConn](
                            const QString &replyTag, const QList<CollectionInfo> &list) {
        if (replyTag != tag) {
            return;
        }
        disconnect(*received);
        disconnect(*failedConn);
        collections_.insert(configId, list);
        emit collectionsChanged(configId);
    });
    *failedConn = connect(service, &IVideoService::operationFailed, this,
                          [tag, received, failedConn](const QString &replyTag,
                                                      const QString &operation,
                                                      const QString &error) {
        if (replyTag != tag) {
            return;
        }
        qWarning() << "LibraryStore:" << operation << "failed:" << error;
        disconnect(*received);
        disconnect(*failedConn);
    });

    service->listCollections(tag, creds);
}

QString LibraryStore::lastSelected() const
{
    QSettings settings;
    const QString id = settings.value(LastSelectedKey).toString();
    return contains(id) ? id : QString();
}

void LibraryStore::setLastSelected(const QString &configId)
{
    QSettings settings;
    if (configId.isEmpty()) {
        settings.remove(LastSelectedKey);
    } else {
        settings.setValue(LastSelectedKey, configId);
    }
}

bool LibraryStore::autoResume() const
{
    QSettings settings;
    return settings.value(AutoResumeKey, true).toBool();
}

void LibraryStore::setAutoResume(bool enabled)
{
    QSettings settings;
    settings.setValue(AutoResumeKey, enabled);
}

bool LibraryStore::keepAwake() const
{
    QSettings settings;
    return settings.value(KeepAwakeKey, true).toBool();
}

void LibraryStore::setKeepAwake(bool enabled)
{
    if (enabled == keepAwake()) {
        return;
    }
    QSettings settings;
    settings.setValue(KeepAwakeKey, enabled);
    emit keepAwakeChanged(enabled);
}

QString LibraryStore::apiEndpoint() const
{
    QSettings settings;
    return settings.value(ApiEndpointKey, QString::fromLatin1(StreamApiClient::DefaultBaseUrl))
        .toString();
}

QString LibraryStore::tusEndpoint() const
{
    QSettings settings;
    return settings.value(TusEndpointKey, QString::fromLatin1(TusUploadSession::DefaultEndpoint))
        .toString();
}

void LibraryStore::loadSettings()
{
    QSettings settings;
    libraries_.clear();

    const QByteArray raw = settings.value(LibrariesKey).toString().toUtf8();
    if (raw.isEmpty()) {
        return;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(raw);
    if (!doc.isArray()) {
        qWarning() << "LibraryStore: ignoring unreadable library list";
        return;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        const LibraryConfig config = LibraryConfig::fromJson(value.toObject());
        if (config.isValid()) {
            libraries_.append(config);
        }
    }
}

void LibraryStore::saveSettings()
{
    QJsonArray array;
    for (const LibraryConfig &config : libraries_) {
        array.append(config.toJson());
    }

    QSettings settings;
    settings.setValue(LibrariesKey,
                      QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact)));
}
