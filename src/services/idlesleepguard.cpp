#include "idlesleepguard.h"

#include <QDebug>
#include <QMutexLocker>

IdleSleepGuard::IdleSleepGuard(QObject *parent)
    : QObject(parent)
{
}

IdleSleepGuard::~IdleSleepGuard()
{
    // Subclass overrides are gone by now, so only drop the flag
    QMutexLocker locker(&mutex_);
    active_ = false;
}

void IdleSleepGuard::setEnabled(bool enabled)
{
    {
        QMutexLocker locker(&mutex_);
        enabled_ = enabled;
    }
    if (!enabled) {
        release();
    }
}

bool IdleSleepGuard::isEnabled() const
{
    QMutexLocker locker(&mutex_);
    return enabled_;
}

bool IdleSleepGuard::isActive() const
{
    QMutexLocker locker(&mutex_);
    return active_;
}

void IdleSleepGuard::acquire()
{
    {
        QMutexLocker locker(&mutex_);
        if (!enabled_ || active_) {
            return;
        }
        if (!platformAcquire()) {
            qWarning() << "IdleSleepGuard: could not prevent idle sleep";
            return;
        }
        active_ = true;
    }
    emit activeChanged(true);
}

void IdleSleepGuard::release()
{
    {
        QMutexLocker locker(&mutex_);
        if (!active_) {
            return;
        }
        platformRelease();
        active_ = false;
    }
    emit activeChanged(false);
}

void IdleSleepGuard::update(bool needed)
{
    if (needed) {
        acquire();
    } else {
        release();
    }
}

bool IdleSleepGuard::platformAcquire()
{
    qDebug() << "IdleSleepGuard: keeping the system awake while uploading";
    return true;
}

void IdleSleepGuard::platformRelease()
{
    qDebug() << "IdleSleepGuard: allowing idle sleep again";
}
