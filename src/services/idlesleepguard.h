/**
 * @file idlesleepguard.h
 * @brief Keeps the machine awake while uploads are queued.
 */

#ifndef IDLESLEEPGUARD_H
#define IDLESLEEPGUARD_H

#include <QMutex>
#include <QObject>

/**
 * @brief Process-wide idle-sleep suppression.
 *
 * acquire() and release() are idempotent and may be called from any
 * thread. The OS-specific work happens in platformAcquire() and
 * platformRelease(); the base implementation only logs, and platform
 * subclasses override both.
 *
 * @par Example usage:
 * @code
 * IdleSleepGuard guard;
 * guard.update(queue->hasActiveOrPending());
 * @endcode
 */
class IdleSleepGuard : public QObject
{
    Q_OBJECT

public:
    explicit IdleSleepGuard(QObject *parent = nullptr);
    ~IdleSleepGuard() override;

    /**
     * @brief Enables or disables the guard (the keep-awake preference).
     *
     * Disabling releases an active assertion.
     */
    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const;

    [[nodiscard]] bool isActive() const;

    /// Takes the assertion if enabled and not already held
    void acquire();

    /// Drops the assertion if held
    void release();

    /// acquire() when @p needed, release() otherwise
    void update(bool needed);

signals:
    void activeChanged(bool active);

protected:
    /// @return True when the OS accepted the assertion
    virtual bool platformAcquire();
    virtual void platformRelease();

private:
    mutable QMutex mutex_;
    bool enabled_ = true;
    bool active_ = false;
};

#endif // IDLESLEEPGUARD_H
