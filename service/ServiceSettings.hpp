// Tunables of the pool, the reaper and preview, persisted with QSettings.
#pragma once
#include <QtGlobal>

class QSettings;

struct ServiceSettings {
    static constexpr int kDefaultIdleTimeoutMs = 5 * 60 * 1000;
    static constexpr int kDefaultSweepIntervalMs = 60 * 1000;
    static constexpr int kDefaultConnectTimeoutMs = 30 * 1000;
    static constexpr int kDefaultKeepaliveSec = 60;
    static constexpr qint64 kDefaultTextLimitBytes = 5LL * 1024 * 1024;
    static constexpr qint64 kDefaultImageLimitBytes = 10LL * 1024 * 1024;

    int idleTimeoutMs = kDefaultIdleTimeoutMs;
    int sweepIntervalMs = kDefaultSweepIntervalMs;
    bool reaperEnabled = true;
    int connectTimeoutMs = kDefaultConnectTimeoutMs;
    int keepaliveSec = kDefaultKeepaliveSec;
    qint64 textPreviewLimitBytes = kDefaultTextLimitBytes;
    qint64 imagePreviewLimitBytes = kDefaultImageLimitBytes;

    // Reads every key; missing or non-positive values keep the default.
    static ServiceSettings load(QSettings& s);
    // Application store: QSettings("Ferry", "Ferry").
    static ServiceSettings loadDefault();

    void save(QSettings& s) const;
};
