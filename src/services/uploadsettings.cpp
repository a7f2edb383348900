#include "uploadsettings.h"

#include <QSettings>
#include <QStandardPaths>

UploadSettings UploadSettings::load(QSettings &settings)
{
    UploadSettings result;
    result.cachePath = settings.value("upload/cachePath", defaultCachePath()).toString();

    bool ok = false;
    int concurrency = settings.value("upload/concurrency", DefaultConcurrency).toInt(&ok);
    result.concurrency = (ok && concurrency >= 1) ? concurrency : DefaultConcurrency;

    int retryDelay = settings.value("upload/retryDelayMs", DefaultRetryDelayMs).toInt(&ok);
    result.retryDelayMs = (ok && retryDelay >= 0) ? retryDelay : DefaultRetryDelayMs;

    int maxAttempts = settings.value("upload/maxAttempts", 0).toInt(&ok);
    result.maxAttempts = (ok && maxAttempts >= 0) ? maxAttempts : 0;

    return result;
}

void UploadSettings::save(QSettings &settings) const
{
    settings.setValue("upload/cachePath", cachePath);
    settings.setValue("upload/concurrency", concurrency);
    settings.setValue("upload/retryDelayMs", retryDelayMs);
    settings.setValue("upload/maxAttempts", maxAttempts);
}

QString UploadSettings::defaultCachePath()
{
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}
