/**
 * @file credentialstore.h
 * @brief Secret storage for library API keys.
 */

#ifndef CREDENTIALSTORE_H
#define CREDENTIALSTORE_H

#include <QString>

/**
 * @brief Stores per-library Stream API keys outside of QSettings.
 *
 * Platform backends talk to the OS keychain. The portable backend in
 * credentialstore_stub.cpp keeps secrets in memory for the lifetime of the
 * process only.
 */
class CredentialStore
{
public:
    /// Keychain service name used for every library key
    static constexpr const char *ServiceName = "streamlift";

    static bool storePassword(const QString &service, const QString &account,
                              const QString &password);
    static QString retrievePassword(const QString &service, const QString &account);
    static bool deletePassword(const QString &service, const QString &account);

    /// @name Library API keys (account = library configuration id)
    /// @{
    static bool storeApiKey(const QString &configId, const QString &apiKey)
    {
        return storePassword(ServiceName, configId, apiKey);
    }
    [[nodiscard]] static QString apiKey(const QString &configId)
    {
        return retrievePassword(ServiceName, configId);
    }
    static bool deleteApiKey(const QString &configId)
    {
        return deletePassword(ServiceName, configId);
    }
    /// @}

private:
    CredentialStore() = default;
};

#endif // CREDENTIALSTORE_H
