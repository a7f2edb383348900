/**
 * @file uploadsettings.h
 * @brief Persistent configuration of the upload engine.
 */

#ifndef UPLOADSETTINGS_H
#define UPLOADSETTINGS_H

#include <QString>

class QSettings;

/**
 * @brief Upload engine settings, persisted with QSettings.
 *
 * Keys live under the "upload/" group:
 * - cachePath       cache root; the staging directory is created inside it
 * - concurrency     maximum concurrent transfers (at least 1)
 * - retryDelayMs    delay before a failed transfer is retried
 * - maxAttempts     attempts per item, 0 for unlimited
 */
struct UploadSettings {
    static constexpr int DefaultConcurrency = 2;
    static constexpr int DefaultRetryDelayMs = 5000;

    QString cachePath;
    int concurrency = DefaultConcurrency;
    int retryDelayMs = DefaultRetryDelayMs;
    int maxAttempts = 0;

    /**
     * @brief Loads settings, falling back to defaults for missing or
     *        out-of-range values.
     */
    [[nodiscard]] static UploadSettings load(QSettings &settings);

    /**
     * @brief Writes every key.
     */
    void save(QSettings &settings) const;

    /**
     * @brief Default cache root under the platform cache location.
     */
    [[nodiscard]] static QString defaultCachePath();
};

#endif // UPLOADSETTINGS_H
