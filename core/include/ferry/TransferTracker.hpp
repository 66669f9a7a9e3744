// Registry of in-flight transfers: byte progress, speed/ETA and the set of
// transfers flagged for cooperative cancellation. Thread-safe.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ferry {

enum class TransferType { Upload, Download };

const char* transferTypeName(TransferType type);

struct TransferMeta {
    TransferType type = TransferType::Upload;
    std::string srcPath;
    std::string destPath;
    std::string fileName;
    std::uint64_t totalBytes = 0;
};

struct TransferRecord {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::string transferId;
    TransferType type = TransferType::Upload;
    std::string srcPath;
    std::string destPath;
    std::string fileName;
    std::uint64_t totalBytes = 0;
    std::uint64_t transferredBytes = 0;
    TimePoint startTime{};
    TimePoint lastUpdate{};
    std::uint64_t lastBytes = 0;
    std::uint64_t transferSpeed = 0;  // bytes/s, last sample only
    std::uint64_t remainingTime = 0;  // seconds
};

// What progress consumers get after every step.
struct ProgressEvent {
    std::string transferId;
    TransferType type = TransferType::Upload;
    std::string fileName;
    int progress = 0; // 0..100
    std::uint64_t transferredBytes = 0;
    std::uint64_t totalBytes = 0;
    std::uint64_t transferSpeed = 0;
    std::uint64_t remainingTime = 0;
};

class TransferTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // Defaults to std::chrono::steady_clock; tests inject a manual clock.
    explicit TransferTracker(Clock clock = {});

    // Registers a transfer. Returns false if the id is already active.
    bool begin(const std::string& transferId, const TransferMeta& meta);

    // Records a sample and returns the resulting event, or nothing when the
    // id is not active. Every call replaces lastUpdate/lastBytes.
    std::optional<ProgressEvent> update(const std::string& transferId,
                                        std::uint64_t transferredBytes,
                                        std::uint64_t totalBytes);

    // Drops the record and any cancellation flag for the id.
    void end(const std::string& transferId);

    // Flags an active transfer for cancellation. False for unknown ids.
    bool requestCancel(const std::string& transferId);
    bool isCancelRequested(const std::string& transferId) const;

    bool contains(const std::string& transferId) const;
    std::optional<TransferRecord> find(const std::string& transferId) const;
    std::vector<TransferRecord> snapshot() const;
    std::size_t size() const;
    std::size_t pendingCancellations() const;

private:
    Clock clock_;
    mutable std::mutex mtx_; // protects records_ and cancelled_
    std::unordered_map<std::string, TransferRecord> records_;
    std::unordered_set<std::string> cancelled_;
};

} // namespace ferry
