/**
 * @file jsonfields.h
 * @brief Tolerant field lookup helpers for JSON records.
 *
 * Persisted records and remote API payloads change shape over time: keys get
 * renamed, identifiers switch between strings and numbers, numbers arrive as
 * ints or doubles. These helpers walk a list of candidate keys and return the
 * first value that can be interpreted, falling back to a default.
 */

#ifndef JSONFIELDS_H
#define JSONFIELDS_H

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QUuid>

namespace JsonFields {

/**
 * @brief Interprets a single value as a string identifier.
 *
 * Accepts strings, integral numbers (remote libraries use numeric ids) and
 * braced UUID strings, which are normalized to the bare form.
 */
[[nodiscard]] inline QString identifierFrom(const QJsonValue &value)
{
    if (value.isString()) {
        const QString s = value.toString();
        if (s.startsWith('{') && s.endsWith('}')) {
            const QUuid uuid(s);
            if (!uuid.isNull()) {
                return uuid.toString(QUuid::WithoutBraces);
            }
        }
        return s;
    }
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return QString();
}

/// First non-empty identifier among @p keys, else @p fallback.
[[nodiscard]] inline QString firstIdentifier(const QJsonObject &obj,
                                             const QStringList &keys,
                                             const QString &fallback = QString())
{
    for (const QString &key : keys) {
        const QString id = identifierFrom(obj.value(key));
        if (!id.isEmpty()) {
            return id;
        }
    }
    return fallback;
}

/// First string value among @p keys (empty strings count as absent).
[[nodiscard]] inline QString firstString(const QJsonObject &obj,
                                         const QStringList &keys,
                                         const QString &fallback = QString())
{
    for (const QString &key : keys) {
        const QJsonValue value = obj.value(key);
        if (value.isString() && !value.toString().isEmpty()) {
            return value.toString();
        }
    }
    return fallback;
}

/**
 * @brief First numeric value among @p keys.
 *
 * Numeric strings are accepted as well, since some payloads quote numbers.
 */
[[nodiscard]] inline double firstNumber(const QJsonObject &obj,
                                        const QStringList &keys,
                                        double fallback)
{
    for (const QString &key : keys) {
        const QJsonValue value = obj.value(key);
        if (value.isDouble()) {
            return value.toDouble();
        }
        if (value.isString()) {
            bool ok = false;
            const double d = value.toString().toDouble(&ok);
            if (ok) {
                return d;
            }
        }
    }
    return fallback;
}

[[nodiscard]] inline qint64 firstInteger(const QJsonObject &obj,
                                         const QStringList &keys,
                                         qint64 fallback)
{
    return static_cast<qint64>(firstNumber(obj, keys, static_cast<double>(fallback)));
}

[[nodiscard]] inline bool boolValue(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool()) {
        return value.toBool();
    }
    if (value.isDouble()) {
        return value.toInt() != 0;
    }
    return fallback;
}

/**
 * @brief Parses a timestamp stored as ISO-8601 text or as epoch seconds.
 * @return An invalid QDateTime when no form matches.
 */
[[nodiscard]] inline QDateTime dateFrom(const QJsonValue &value)
{
    if (value.isString()) {
        const QString raw = value.toString();
        QDateTime dt = QDateTime::fromString(raw, Qt::ISODateWithMs);
        if (!dt.isValid()) {
            dt = QDateTime::fromString(raw, Qt::ISODate);
        }
        if (!dt.isValid()) {
            bool ok = false;
            const double seconds = raw.toDouble(&ok);
            if (ok) {
                dt = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(seconds * 1000.0)).toUTC();
            }
        }
        return dt;
    }
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble() * 1000.0)).toUTC();
    }
    return QDateTime();
}

[[nodiscard]] inline QDateTime firstDate(const QJsonObject &obj, const QStringList &keys)
{
    for (const QString &key : keys) {
        const QDateTime dt = dateFrom(obj.value(key));
        if (dt.isValid()) {
            return dt;
        }
    }
    return QDateTime();
}

/// ISO-8601 with milliseconds in UTC, or null for an invalid date.
[[nodiscard]] inline QJsonValue dateToJson(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

} // namespace JsonFields

#endif // JSONFIELDS_H
