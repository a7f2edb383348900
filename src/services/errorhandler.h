/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how errors are categorized, graded, and logged
 * across the upload engine. The filesystem layer only ever sees success or
 * permanent failure per item; everything else surfaces here.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Transfer,    ///< Remote store calls that failed or returned oddities
    Storage,     ///< Descriptor or staged-file I/O
    Recovery,    ///< Problems while resuming work from a previous run
    Validation,  ///< Rejected input at intake
    System       ///< Unexpected conditions and programming errors
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - logged with qInfo
    Warning,   ///< Absorbed internally, e.g. a retryable transfer failure
    Critical   ///< Needs attention; the item or the engine is affected
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the engine:
 * - Categorizes errors for appropriate handling
 * - Logs errors through Qt's message handler by severity
 * - Emits errorLogged() so monitoring can observe absorbed failures
 *
 * Safe to call from any thread. errorLogged() is emitted on the calling
 * thread, so receivers in other threads get it through a queued connection.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(handler, &ErrorHandler::errorLogged,
 *         monitor, &Monitor::record);
 *
 * handler->handleError(ErrorCategory::Storage,
 *                      ErrorSeverity::Warning,
 *                      "Descriptor write failed: a.txt",
 *                      file.errorString());
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a retryable transfer failure (warning severity).
     * @param path Logical path of the item.
     * @param error The error message.
     */
    void handleTransferError(const QString &path, const QString &error);

    /**
     * @brief Handles a descriptor or staged-file I/O error (critical severity).
     * @param operation The operation that failed (e.g., "write descriptor").
     * @param error The error message.
     */
    void handleStorageError(const QString &operation, const QString &error);

    /**
     * @brief Handles a condition that indicates a defect (critical severity).
     * @param message The error message.
     */
    void handleUnexpected(const QString &message);
    /// @}

    /**
     * @brief Converts category to string for logging.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)

#endif // ERRORHANDLER_H
