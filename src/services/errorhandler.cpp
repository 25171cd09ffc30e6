#include "errorhandler.h"

#include <QDebug>
#include <QStringList>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleUploadFailed(const QString &itemId, ErrorCategory category,
                                      const QString &message)
{
    failures_[category] += 1;
    qDebug() << "ErrorHandler: upload" << itemId << "failed," << failureCount() << "so far";
    handleError(category,
                severityForCategory(category),
                tr("Upload failed"),
                message);
}

void ErrorHandler::handleOperationFailed(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::System,
                ErrorSeverity::Warning,
                tr("%1 failed").arg(operation),
                error);
}

void ErrorHandler::handleConnectivityChanged(bool connected)
{
    if (connected) {
        emit statusMessage(tr("Network available, resuming uploads"),
                           timeoutForSeverity(ErrorSeverity::Info));
        return;
    }
    handleError(ErrorCategory::Network,
                ErrorSeverity::Info,
                tr("Network unavailable"),
                tr("Uploads paused until the connection returns"));
}

int ErrorHandler::failureCount() const
{
    int total = 0;
    for (auto it = failures_.constBegin(); it != failures_.constEnd(); ++it) {
        total += it.value();
    }
    return total;
}

QString ErrorHandler::failureSummary() const
{
    const int total = failureCount();
    if (total == 0) {
        return QString();
    }

    QStringList parts;
    for (auto it = failures_.constBegin(); it != failures_.constEnd(); ++it) {
        parts.append(QString("%1: %2").arg(categoryToString(it.key())).arg(it.value()));
    }
    return tr("%1 upload(s) failed (%2)").arg(total).arg(parts.join(", "));
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

ErrorSeverity ErrorHandler::severityForCategory(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Network:
        return ErrorSeverity::Info;
    case ErrorCategory::Protocol:
    case ErrorCategory::LocalFile:
        return ErrorSeverity::Warning;
    case ErrorCategory::Configuration:
    case ErrorCategory::ResourceBootstrap:
    case ErrorCategory::System:
        return ErrorSeverity::Critical;
    }
    return ErrorSeverity::Warning;
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;  // 3 seconds
    case ErrorSeverity::Warning:
        return 5000;  // 5 seconds
    case ErrorSeverity::Critical:
        return 0;     // No timeout - stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
    case ErrorCategory::ResourceBootstrap:
        return QStringLiteral("Bootstrap");
    case ErrorCategory::Network:
        return QStringLiteral("Network");
    case ErrorCategory::Protocol:
        return QStringLiteral("Protocol");
    case ErrorCategory::LocalFile:
        return QStringLiteral("LocalFile");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
