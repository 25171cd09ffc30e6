#include "credentialstore.h"

#include <QDebug>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>

// Portable backend for platforms without native credential storage.
// Secrets live in memory only and are gone when the process exits.

namespace {

QMutex &storeMutex()
{
    static QMutex mutex;
    return mutex;
}

QHash<QString, QString> &secrets()
{
    static QHash<QString, QString> store;
    return store;
}

QString keyFor(const QString &service, const QString &account)
{
    return service + QLatin1Char('/') + account;
}

} // namespace

bool CredentialStore::storePassword(const QString &service, const QString &account,
                                    const QString &password)
{
    if (account.isEmpty()) {
        return false;
    }
    QMutexLocker locker(&storeMutex());
    static bool warned = false;
    if (!warned) {
        qWarning() << "CredentialStore: no keychain backend, keys are kept for this session only";
        warned = true;
    }
    secrets().insert(keyFor(service, account), password);
    return true;
}

QString CredentialStore::retrievePassword(const QString &service, const QString &account)
{
    QMutexLocker locker(&storeMutex());
    return secrets().value(keyFor(service, account));
}

bool CredentialStore::deletePassword(const QString &service, const QString &account)
{
    QMutexLocker locker(&storeMutex());
    secrets().remove(keyFor(service, account));
    return true;
}
