/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how upload and library errors are categorized,
 * logged and forwarded to whichever front end is listening.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QMap>
#include <QMetaType>
#include <QObject>
#include <QString>

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Configuration,      ///< Missing or invalid library configuration (API key)
    ResourceBootstrap,  ///< Remote video resource could not be created
    Network,            ///< Connectivity loss; handled as a pause
    Protocol,           ///< Unexpected tus responses after retries ran out
    LocalFile,          ///< Source file missing or unreadable
    System              ///< General system/application errors
};

Q_DECLARE_METATYPE(ErrorCategory)

/**
 * @brief Severity levels determining how errors are presented.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - short status message
    Warning,   ///< Warning - longer status message
    Critical   ///< Critical - status message stays until replaced
};

/**
 * @brief Centralized error handling service.
 *
 * Every error is logged through the Qt message handlers with a
 * "[Category/SEVERITY]" prefix and turned into a status message whose
 * display time follows the severity. Upload failures additionally count
 * towards a per-category tally that front ends use for exit codes and
 * summaries.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(queue, &UploadQueue::uploadFailed,
 *         handler, &ErrorHandler::handleUploadFailed);
 *
 * handler->handleError(ErrorCategory::System,
 *                      ErrorSeverity::Warning,
 *                      "Could not save queue",
 *                      "Disk full");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Logs an error and emits the matching status message.
     * @param title Short summary, e.g. "Upload failed".
     * @param details Appended after a colon unless empty or equal to @p title.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a failed upload reported by the queue.
     *
     * The severity follows severityForCategory() and the failure is added
     * to the tally.
     *
     * @param itemId Queue entry id.
     * @param category Failure category.
     * @param message The error message recorded on the entry.
     */
    void handleUploadFailed(const QString &itemId, ErrorCategory category,
                            const QString &message);

    /**
     * @brief Handles a failed remote API operation (warning severity).
     * @param operation The operation that failed (e.g., "deleteVideo").
     * @param error The error message.
     */
    void handleOperationFailed(const QString &operation, const QString &error);

    /**
     * @brief Reports connectivity changes (info severity on loss).
     * @param connected True when the network is reachable again.
     */
    void handleConnectivityChanged(bool connected);
    /// @}

    /// @name Failure Tally
    /// @{
    [[nodiscard]] int failureCount() const;
    [[nodiscard]] int failureCount(ErrorCategory category) const { return failures_.value(category); }

    /// One line such as "2 upload(s) failed (Config: 1, Protocol: 1)", empty without failures
    [[nodiscard]] QString failureSummary() const;

    void resetFailures() { failures_.clear(); }
    /// @}

    /// Severity used for upload failures of a category
    [[nodiscard]] static ErrorSeverity severityForCategory(ErrorCategory category);

    /// Status message timeout in milliseconds; 0 keeps the message until replaced
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    /// @name Log Prefixes
    /// @{
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
    /// @}

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /// Emitted for every logged error, after the log line is written
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    QMap<ErrorCategory, int> failures_;
};

#endif // ERRORHANDLER_H
