#include "uploaddescriptor.h"

namespace {
const QLatin1String kIdKey("id");
const QLatin1String kPathKey("path");
const QLatin1String kParentIdKey("parentId");
const QLatin1String kLengthKey("length");
const QLatin1String kOverwriteKey("overwrite");
const QLatin1String kCreatedKey("created");
} // namespace

QString UploadDescriptor::name() const
{
    int slash = path.lastIndexOf('/');
    return slash < 0 ? path : path.mid(slash + 1);
}

QJsonObject UploadDescriptor::toJson() const
{
    QJsonObject json;
    json[kIdKey] = id;
    json[kPathKey] = path;
    json[kParentIdKey] = parentId;
    json[kLengthKey] = length;
    json[kOverwriteKey] = overwrite;
    json[kCreatedKey] = created;
    return json;
}

std::optional<UploadDescriptor> UploadDescriptor::fromJson(const QJsonObject &json)
{
    if (!json.value(kIdKey).isString() || !json.value(kPathKey).isString()
        || !json.value(kParentIdKey).isString() || !json.value(kLengthKey).isDouble()) {
        return std::nullopt;
    }

    UploadDescriptor descriptor;
    descriptor.id = json.value(kIdKey).toString();
    descriptor.path = json.value(kPathKey).toString();
    descriptor.parentId = json.value(kParentIdKey).toString();
    descriptor.length = json.value(kLengthKey).toInteger();
    // Records written before overwrite support default to create-new
    descriptor.overwrite = json.value(kOverwriteKey).toBool(false);
    // Older records carry no intake key; recovery falls back to the file time
    descriptor.created = qMax<qint64>(0, json.value(kCreatedKey).toInteger(0));

    if (descriptor.id.isEmpty() || descriptor.length < 0) {
        return std::nullopt;
    }
    return descriptor;
}
