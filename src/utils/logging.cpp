#include "logging.h"

Q_LOGGING_CATEGORY(lcUpload, "stageup.upload")

namespace stageup {

void setVerboseLogging(bool enabled)
{
    verboseLogging = enabled;
    if (enabled) {
        // Debug output may be disabled by the platform's default rules
        QLoggingCategory::setFilterRules(QStringLiteral("stageup.upload.debug=true"));
    }
}

} // namespace stageup
