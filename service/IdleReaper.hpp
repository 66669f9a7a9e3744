// Periodic sweep that closes pooled sessions left idle too long.
#pragma once
#include <QObject>
#include <QTimer>

class ConnectionPool;

class IdleReaper : public QObject {
    Q_OBJECT
public:
    IdleReaper(ConnectionPool& pool, int intervalMs, QObject* parent = nullptr);

    void start();
    void stop();
    bool isActive() const { return timer_.isActive(); }
    int interval() const { return timer_.interval(); }

    // One sweep, synchronously. Returns the number of sessions closed.
    int sweepNow();

signals:
    void swept(int closed);

private:
    ConnectionPool& pool_;
    QTimer timer_;
};
