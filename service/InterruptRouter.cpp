#include "InterruptRouter.hpp"
#include "LogCategories.hpp"
#include "TransferService.hpp"

InterruptRouter::InterruptRouter(TransferService& service, QObject* parent)
    : QObject(parent), service_(service) {
    connect(&service_, &TransferService::transferStarted, this,
            [this](const QString&, const QString&, const QString&) {
                pending_ = false;
                ++active_;
            });
    connect(&service_, &TransferService::transferFinished, this,
            [this](const QString&, bool, bool, const QString&) {
                if (active_.load() > 0)
                    --active_;
                if (active_.load() == 0)
                    pending_ = false;
            });
    connect(&service_, &TransferService::transferProgress, this,
            [this](const ferry::ProgressEvent& ev) {
                if (!pending_.exchange(false))
                    return;
                const OpResult r = service_.cancelTransfer(ev.transferId);
                if (!r.success)
                    qCWarning(ferryXfer) << "Interrupt could not cancel"
                                         << QString::fromStdString(ev.transferId)
                                         << QString::fromStdString(r.error);
            });
}

InterruptRouter::Action InterruptRouter::interrupt() noexcept {
    if (active_.load() == 0)
        return Action::Terminate;
    pending_ = true;
    return Action::CancelTransfer;
}
