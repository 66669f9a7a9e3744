// Pool of remote sessions keyed by "host:port:user". Concurrent requests for
// one key share a single connection attempt; idle sessions are reaped.
#pragma once
#include "ferry/SftpTypes.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ferry { class SftpClient; }

struct ConnectOutcome {
    bool ok = false;
    std::string error;
};

struct ConnectionHandle {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::string key;
    std::shared_ptr<ferry::SftpClient> session;
    bool connected = false;
    bool connecting = false;
    std::shared_future<ConnectOutcome> connectFuture;
    TimePoint lastActivity{};
    int activeOps = 0; // live leases; the reaper leaves these alone
};

class ConnectionPool;

// Borrowed access to a pooled session. Counts as one active operation on the
// handle until destroyed; returning it refreshes lastActivity.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease();
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;
    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    explicit operator bool() const { return handle_ != nullptr; }
    ferry::SftpClient* client() const;
    const std::string& key() const;

    void reset();

private:
    friend class ConnectionPool;
    ConnectionLease(ConnectionPool* pool, std::shared_ptr<ConnectionHandle> h)
        : pool_(pool), handle_(std::move(h)) {}

    ConnectionPool* pool_ = nullptr;
    std::shared_ptr<ConnectionHandle> handle_;
};

class ConnectionPool {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // prototype->newConnectionLike() opens every pooled session.
    ConnectionPool(std::shared_ptr<ferry::SftpClient> prototype,
                   std::chrono::milliseconds idleTimeout,
                   Clock clock = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Returns a lease on a connected session for opt's endpoint, connecting
    // if needed. On failure the lease is empty and err says why.
    ConnectionLease acquire(const ferry::SessionOptions& opt, std::string& err);

    // Closes and forgets a connected session. Connecting handles are kept.
    bool release(const std::string& key);

    // Releases connected sessions idle for longer than the timeout and not
    // leased. Returns how many were closed.
    int reapIdle();

    // Releases every connected session.
    int closeAll();

    std::size_t size() const;
    bool contains(const std::string& key) const;
    int activeOps(const std::string& key) const;

    void setIdleTimeout(std::chrono::milliseconds t);
    std::chrono::milliseconds idleTimeout() const;

private:
    friend class ConnectionLease;
    void returnLease(ConnectionHandle& h);
    static void closeSession(const std::string& key,
                             const std::shared_ptr<ferry::SftpClient>& s);

    std::shared_ptr<ferry::SftpClient> prototype_;
    Clock clock_;
    mutable std::mutex mtx_; // protects handles_, idleTimeout_ and handle fields
    std::chrono::milliseconds idleTimeout_;
    std::unordered_map<std::string, std::shared_ptr<ConnectionHandle>> handles_;
};
