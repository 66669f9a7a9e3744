#include "ConnectionPool.hpp"
#include "LogCategories.hpp"
#include "ferry/RuntimeLogging.hpp"
#include "ferry/SftpClient.hpp"
#include <QString>
#include <exception>
#include <utility>
#include <vector>

namespace {

QString endpointForLog(const std::string& key) {
    return QString::fromStdString(ferry::loggableEndpoint(key));
}

} // namespace

ConnectionLease::~ConnectionLease() {
    reset();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(other.pool_), handle_(std::move(other.handle_)) {
    other.pool_ = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        reset();
        pool_ = other.pool_;
        handle_ = std::move(other.handle_);
        other.pool_ = nullptr;
    }
    return *this;
}

ferry::SftpClient* ConnectionLease::client() const {
    return handle_ ? handle_->session.get() : nullptr;
}

const std::string& ConnectionLease::key() const {
    static const std::string empty;
    return handle_ ? handle_->key : empty;
}

void ConnectionLease::reset() {
    if (pool_ && handle_)
        pool_->returnLease(*handle_);
    pool_ = nullptr;
    handle_.reset();
}

ConnectionPool::ConnectionPool(std::shared_ptr<ferry::SftpClient> prototype,
                               std::chrono::milliseconds idleTimeout,
                               Clock clock)
    : prototype_(std::move(prototype)),
      clock_(std::move(clock)),
      idleTimeout_(idleTimeout) {
    if (!clock_)
        clock_ = [] { return std::chrono::steady_clock::now(); };
}

ConnectionPool::~ConnectionPool() {
    closeAll();
}

void ConnectionPool::returnLease(ConnectionHandle& h) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lk(mtx_);
    if (h.activeOps > 0)
        --h.activeOps;
    h.lastActivity = now;
}

void ConnectionPool::closeSession(const std::string& key,
                                  const std::shared_ptr<ferry::SftpClient>& s) {
    if (!s)
        return;
    try {
        s->disconnect();
    } catch (const std::exception& ex) {
        qCWarning(ferryPool) << "Error closing session" << endpointForLog(key)
                             << ex.what();
    }
}

ConnectionLease ConnectionPool::acquire(const ferry::SessionOptions& opt,
                                        std::string& err) {
    if (!prototype_) {
        err = "No SFTP backend configured";
        return {};
    }
    const std::string key = ferry::endpointKey(opt);
    const std::uint16_t port = opt.port ? opt.port : 22;

    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        std::shared_ptr<ferry::SftpClient> stale;
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            std::shared_ptr<ConnectionHandle> h = it->second;
            if (h->connected) {
                if (h->session && h->session->isConnected()) {
                    h->lastActivity = clock_();
                    ++h->activeOps;
                    qCDebug(ferryPool) << "Reusing session" << endpointForLog(key);
                    return ConnectionLease(this, h);
                }
                // Dropped by the server: replace it.
                qCInfo(ferryPool) << "Session dropped, reconnecting" << endpointForLog(key);
                stale = h->session;
                handles_.erase(it);
            } else if (h->connecting) {
                std::shared_future<ConnectOutcome> fut = h->connectFuture;
                lk.unlock();
                const ConnectOutcome& outcome = fut.get();
                if (!outcome.ok) {
                    err = outcome.error;
                    return {};
                }
                lk.lock();
                auto again = handles_.find(key);
                if (again != handles_.end() && again->second == h && h->connected) {
                    h->lastActivity = clock_();
                    ++h->activeOps;
                    return ConnectionLease(this, h);
                }
                // Released between the connect and our wake-up; start over.
                continue;
            }
        }

        auto h = std::make_shared<ConnectionHandle>();
        h->key = key;
        h->connecting = true;
        std::promise<ConnectOutcome> promise;
        h->connectFuture = promise.get_future().share();
        handles_[key] = h;
        lk.unlock();

        if (stale)
            closeSession(key, stale);

        qCInfo(ferryPool) << "Connecting" << endpointForLog(key);
        std::string connectErr;
        std::unique_ptr<ferry::SftpClient> client;
        try {
            client = prototype_->newConnectionLike(opt, connectErr);
        } catch (const std::exception& ex) {
            // Host key and keyboard-interactive callbacks run in here.
            client.reset();
            connectErr = ex.what();
        }

        lk.lock();
        if (!client) {
            auto own = handles_.find(key);
            if (own != handles_.end() && own->second == h)
                handles_.erase(own);
            h->connecting = false;
            lk.unlock();
            const std::string message = "SFTP connection failed (" + opt.host + ":" +
                                        std::to_string(port) + "): " +
                                        (connectErr.empty() ? std::string("unknown error") : connectErr);
            qCWarning(ferryPool) << "Connect failed" << endpointForLog(key)
                                 << QString::fromStdString(connectErr);
            promise.set_value(ConnectOutcome{false, message});
            err = message;
            return {};
        }
        h->session = std::shared_ptr<ferry::SftpClient>(std::move(client));
        h->connecting = false;
        h->connected = true;
        h->lastActivity = clock_();
        ++h->activeOps;
        lk.unlock();
        promise.set_value(ConnectOutcome{true, {}});
        qCInfo(ferryPool) << "Connected" << endpointForLog(key);
        return ConnectionLease(this, h);
    }
}

bool ConnectionPool::release(const std::string& key) {
    std::shared_ptr<ferry::SftpClient> session;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = handles_.find(key);
        if (it == handles_.end() || !it->second->connected)
            return false;
        session = it->second->session;
        it->second->connected = false;
        handles_.erase(it);
    }
    closeSession(key, session);
    qCInfo(ferryPool) << "Released" << endpointForLog(key);
    return true;
}

int ConnectionPool::reapIdle() {
    std::vector<std::pair<std::string, std::shared_ptr<ferry::SftpClient>>> idle;
    {
        const auto now = clock_();
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = handles_.begin(); it != handles_.end();) {
            ConnectionHandle& h = *it->second;
            if (h.connected && h.activeOps == 0 && now - h.lastActivity > idleTimeout_) {
                h.connected = false;
                idle.emplace_back(it->first, h.session);
                it = handles_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& kv : idle) {
        closeSession(kv.first, kv.second);
        qCInfo(ferryPool) << "Closed idle session" << endpointForLog(kv.first);
    }
    return static_cast<int>(idle.size());
}

int ConnectionPool::closeAll() {
    std::vector<std::pair<std::string, std::shared_ptr<ferry::SftpClient>>> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = handles_.begin(); it != handles_.end();) {
            if (it->second->connected) {
                it->second->connected = false;
                all.emplace_back(it->first, it->second->session);
                it = handles_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& kv : all)
        closeSession(kv.first, kv.second);
    if (!all.empty())
        qCInfo(ferryPool) << "Closed" << all.size() << "session(s)";
    return static_cast<int>(all.size());
}

std::size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return handles_.size();
}

bool ConnectionPool::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return handles_.count(key) > 0;
}

int ConnectionPool::activeOps(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = handles_.find(key);
    return it == handles_.end() ? 0 : it->second->activeOps;
}

void ConnectionPool::setIdleTimeout(std::chrono::milliseconds t) {
    std::lock_guard<std::mutex> lk(mtx_);
    idleTimeout_ = t;
}

std::chrono::milliseconds ConnectionPool::idleTimeout() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return idleTimeout_;
}
