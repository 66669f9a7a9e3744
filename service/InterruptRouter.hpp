// Decides what Ctrl+C means for a TransferService user: cancel the transfer
// that is running, or end the process when nothing is running.
#pragma once
#include <QObject>
#include <atomic>

class TransferService;

class InterruptRouter : public QObject {
    Q_OBJECT
public:
    enum class Action { Terminate, CancelTransfer };

    explicit InterruptRouter(TransferService& service, QObject* parent = nullptr);

    // Async-signal-safe. While a transfer runs, the cancel is queued and
    // applied at its next progress event.
    Action interrupt() noexcept;

    bool transferActive() const noexcept { return active_.load() > 0; }
    bool cancelPending() const noexcept { return pending_.load(); }

private:
    TransferService& service_;
    std::atomic<int> active_{0};
    std::atomic<bool> pending_{false};
};
