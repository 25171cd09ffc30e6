/**
 * @file librarystore.h
 * @brief Service for managing configured video libraries and app preferences.
 */

#ifndef LIBRARYSTORE_H
#define LIBRARYSTORE_H

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

#include "ivideoservice.h"

/**
 * @brief A remote library the user can upload to.
 */
struct LibraryConfig {
    QString id;            ///< Local configuration id (UUID string)
    QString name;          ///< Display name
    QString libraryId;     ///< Remote library id
    QString pullZoneHost;  ///< Optional CDN host for thumbnails

    [[nodiscard]] bool isValid() const { return !id.isEmpty() && !libraryId.isEmpty(); }

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static LibraryConfig fromJson(const QJsonObject &json);
};

/**
 * @brief Manages library configurations and upload preferences.
 *
 * Configurations and preferences are persisted using QSettings and loaded
 * at construction. API keys are kept in CredentialStore, keyed by the
 * configuration id, and never written to QSettings.
 */
class LibraryStore : public QObject
{
    Q_OBJECT

public:
    /// @name QSettings keys
    /// @{
    static constexpr const char *LibrariesKey = "libraries/list";
    static constexpr const char *DefaultCollectionsGroup = "libraries/defaultCollections";
    static constexpr const char *LastSelectedKey = "libraries/lastSelected";
    static constexpr const char *AutoResumeKey = "uploads/autoResume";
    static constexpr const char *KeepAwakeKey = "power/keepAwake";
    static constexpr const char *ApiEndpointKey = "endpoints/api";
    static constexpr const char *TusEndpointKey = "endpoints/tus";
    /// @}

    explicit LibraryStore(QObject *parent = nullptr);
    ~LibraryStore() override = default;

    /// @name Libraries
    /// @{
    [[nodiscard]] QList<LibraryConfig> libraries() const { return libraries_; }
    [[nodiscard]] int count() const { return libraries_.count(); }
    [[nodiscard]] bool contains(const QString &configId) const;

    /**
     * @brief Returns the configuration with @p configId, or an invalid one.
     */
    [[nodiscard]] LibraryConfig library(const QString &configId) const;

    /**
     * @brief Adds a library and stores its API key.
     * @return The new configuration id, or an empty string when name or
     *         library id is missing.
     */
    QString addLibrary(const QString &name, const QString &libraryId,
                       const QString &apiKey, const QString &pullZoneHost = QString());

    bool renameLibrary(const QString &configId, const QString &name);
    bool removeLibrary(const QString &configId);
    /// @}

    /// @name Credentials
    /// @{
    [[nodiscard]] QString apiKey(const QString &configId) const;
    [[nodiscard]] bool hasApiKey(const QString &configId) const { return !apiKey(configId).isEmpty(); }
    bool setApiKey(const QString &configId, const QString &apiKey);

    /**
     * @brief Remote library id and API key for @p configId.
     *
     * Invalid credentials are returned when the library is unknown or has
     * no key.
     */
    [[nodiscard]] LibraryCredentials credentials(const QString &configId) const;
    /// @}

    /// @name Collections
    /// @{
    [[nodiscard]] QString defaultCollection(const QString &configId) const;
    void setDefaultCollection(const QString &configId, const QString &collectionId);

    /// Collections fetched by the last refreshCollections() for @p configId
    [[nodiscard]] QList<CollectionInfo> collections(const QString &configId) const
    {
        return collections_.value(configId);
    }

    /**
     * @brief Fetches the collections of a library through @p service.
     *
     * Emits collectionsChanged() when the list arrives. Does nothing when
     * the library has no API key.
     */
    void refreshCollections(const QString &configId, IVideoService *service);
    /// @}

    /// @name Preferences
    /// @{
    [[nodiscard]] QString lastSelected() const;
    void setLastSelected(const QString &configId);

    [[nodiscard]] bool autoResume() const;
    void setAutoResume(bool enabled);

    [[nodiscard]] bool keepAwake() const;
    void setKeepAwake(bool enabled);

    [[nodiscard]] QString apiEndpoint() const;
    [[nodiscard]] QString tusEndpoint() const;
    /// @}

    /**
     * @brief Loads configurations from persistent storage.
     */
    void loadSettings();

    /**
     * @brief Saves configurations to persistent storage.
     */
    void saveSettings();

signals:
    void librariesChanged();
    void collectionsChanged(const QString &configId);
    void keepAwakeChanged(bool enabled);

private:
    int indexOf(const QString &configId) const;

    QList<LibraryConfig> libraries_;
    QHash<QString, QList<CollectionInfo>> collections_;
};

#endif // LIBRARYSTORE_H
