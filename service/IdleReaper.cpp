#include "IdleReaper.hpp"
#include "ConnectionPool.hpp"
#include "LogCategories.hpp"
#include <exception>

IdleReaper::IdleReaper(ConnectionPool& pool, int intervalMs, QObject* parent)
    : QObject(parent), pool_(pool) {
    timer_.setInterval(intervalMs > 0 ? intervalMs : 60 * 1000);
    connect(&timer_, &QTimer::timeout, this, [this] { sweepNow(); });
}

void IdleReaper::start() {
    qCInfo(ferryReaper) << "Idle sweep every" << timer_.interval() << "ms,"
                        << "timeout" << pool_.idleTimeout().count() << "ms";
    timer_.start();
}

void IdleReaper::stop() {
    timer_.stop();
}

int IdleReaper::sweepNow() {
    int closed = 0;
    try {
        closed = pool_.reapIdle();
    } catch (const std::exception& ex) {
        // The next tick tries again.
        qCWarning(ferryReaper) << "Idle sweep failed:" << ex.what();
    }
    if (closed > 0)
        qCInfo(ferryReaper) << "Swept" << closed << "idle session(s)";
    else
        qCDebug(ferryReaper) << "Nothing to sweep";
    emit swept(closed);
    return closed;
}
