#include "ServiceSettings.hpp"
#include <QSettings>

namespace {

int positiveInt(const QSettings& s, const char* key, int fallback) {
    bool ok = false;
    const int v = s.value(key, fallback).toInt(&ok);
    return (ok && v > 0) ? v : fallback;
}

qint64 positiveInt64(const QSettings& s, const char* key, qint64 fallback) {
    bool ok = false;
    const qint64 v = s.value(key, fallback).toLongLong(&ok);
    return (ok && v > 0) ? v : fallback;
}

} // namespace

ServiceSettings ServiceSettings::load(QSettings& s) {
    ServiceSettings out;
    out.idleTimeoutMs = positiveInt(s, "Pool/idleTimeoutMs", kDefaultIdleTimeoutMs);
    out.sweepIntervalMs = positiveInt(s, "Pool/sweepIntervalMs", kDefaultSweepIntervalMs);
    out.reaperEnabled = s.value("Pool/reaperEnabled", true).toBool();
    out.connectTimeoutMs = positiveInt(s, "Connection/connectTimeoutMs", kDefaultConnectTimeoutMs);
    out.keepaliveSec = positiveInt(s, "Connection/keepaliveSec", kDefaultKeepaliveSec);
    out.textPreviewLimitBytes = positiveInt64(s, "Preview/textLimitBytes", kDefaultTextLimitBytes);
    out.imagePreviewLimitBytes = positiveInt64(s, "Preview/imageLimitBytes", kDefaultImageLimitBytes);
    return out;
}

ServiceSettings ServiceSettings::loadDefault() {
    QSettings s("Ferry", "Ferry");
    return load(s);
}

void ServiceSettings::save(QSettings& s) const {
    s.setValue("Pool/idleTimeoutMs", idleTimeoutMs);
    s.setValue("Pool/sweepIntervalMs", sweepIntervalMs);
    s.setValue("Pool/reaperEnabled", reaperEnabled);
    s.setValue("Connection/connectTimeoutMs", connectTimeoutMs);
    s.setValue("Connection/keepaliveSec", keepaliveSec);
    s.setValue("Preview/textLimitBytes", textPreviewLimitBytes);
    s.setValue("Preview/imageLimitBytes", imagePreviewLimitBytes);
    s.sync();
}
