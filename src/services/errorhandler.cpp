#include "errorhandler.h"

#include <QDebug>

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
}

void ErrorHandler::handleTransferError(const QString &path, const QString &error)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                tr("Upload failed: %1").arg(path),
                error);
}

void ErrorHandler::handleStorageError(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::Storage,
                ErrorSeverity::Critical,
                tr("%1 failed").arg(operation),
                error);
}

void ErrorHandler::handleUnexpected(const QString &message)
{
    handleError(ErrorCategory::System,
                ErrorSeverity::Critical,
                tr("Unexpected condition"),
                message);
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

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Storage:
        return QStringLiteral("Storage");
    case ErrorCategory::Recovery:
        return QStringLiteral("Recovery");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
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
