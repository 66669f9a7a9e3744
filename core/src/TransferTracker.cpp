#include "ferry/TransferTracker.hpp"
#include "ferry/SpeedEstimator.hpp"

namespace ferry {

const char* transferTypeName(TransferType type) {
    switch (type) {
    case TransferType::Upload:
        return "upload";
    case TransferType::Download:
        return "download";
    }
    return "unknown";
}

TransferTracker::TransferTracker(Clock clock) : clock_(std::move(clock)) {
    if (!clock_)
        clock_ = [] { return std::chrono::steady_clock::now(); };
}

bool TransferTracker::begin(const std::string& transferId,
                            const TransferMeta& meta) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lk(mtx_);
    if (records_.count(transferId) > 0)
        return false;
    TransferRecord r;
    r.transferId = transferId;
    r.type = meta.type;
    r.srcPath = meta.srcPath;
    r.destPath = meta.destPath;
    r.fileName = meta.fileName;
    r.totalBytes = meta.totalBytes;
    r.startTime = now;
    r.lastUpdate = now;
    records_.emplace(transferId, std::move(r));
    // A stale flag must never cancel a fresh transfer that reuses the id.
    cancelled_.erase(transferId);
    return true;
}

std::optional<ProgressEvent> TransferTracker::update(const std::string& transferId,
                                                     std::uint64_t transferredBytes,
                                                     std::uint64_t totalBytes) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(transferId);
    if (it == records_.end())
        return std::nullopt;
    TransferRecord& r = it->second;

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - r.lastUpdate);
    const std::uint64_t bps =
        speed::bytesPerSecond(r.lastBytes, transferredBytes, elapsed);

    r.transferredBytes = transferredBytes;
    if (totalBytes > 0)
        r.totalBytes = totalBytes;
    r.transferSpeed = bps;
    r.remainingTime = speed::remainingSeconds(transferredBytes, r.totalBytes, bps);
    r.lastUpdate = now;
    r.lastBytes = transferredBytes;

    ProgressEvent ev;
    ev.transferId = r.transferId;
    ev.type = r.type;
    ev.fileName = r.fileName;
    ev.progress = speed::percent(transferredBytes, r.totalBytes);
    ev.transferredBytes = transferredBytes;
    ev.totalBytes = r.totalBytes;
    ev.transferSpeed = r.transferSpeed;
    ev.remainingTime = r.remainingTime;
    return ev;
}

void TransferTracker::end(const std::string& transferId) {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.erase(transferId);
    cancelled_.erase(transferId);
}

bool TransferTracker::requestCancel(const std::string& transferId) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (records_.count(transferId) == 0)
        return false;
    cancelled_.insert(transferId);
    return true;
}

bool TransferTracker::isCancelRequested(const std::string& transferId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancelled_.count(transferId) > 0;
}

bool TransferTracker::contains(const std::string& transferId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.count(transferId) > 0;
}

std::optional<TransferRecord> TransferTracker::find(const std::string& transferId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(transferId);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<TransferRecord> TransferTracker::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_)
        out.push_back(kv.second);
    return out;
}

std::size_t TransferTracker::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.size();
}

std::size_t TransferTracker::pendingCancellations() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancelled_.size();
}

} // namespace ferry
