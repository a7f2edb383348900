/**
 * @file logging.h
 * @brief Upload engine log category with a runtime verbose switch.
 *
 * Warnings and errors always go through qWarning()/qCritical(). Per-item
 * tracing (dispatch, attempts, outcomes) is only emitted in verbose mode,
 * under the "stageup.upload" category so it can also be filtered with
 * QT_LOGGING_RULES.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcUpload)

namespace stageup {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

/// Turns per-item tracing on or off
void setVerboseLogging(bool enabled);

} // namespace stageup

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (stageup::verboseLogging) qCDebug(lcUpload)

#endif // LOGGING_H
