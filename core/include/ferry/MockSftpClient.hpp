#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>

namespace ferry {

// In-memory remote file system shared by a mock client and every connection
// created from it with newConnectionLike(). Also carries the behavior knobs
// and counters tests use to inject failures and observe connects.
struct MockRemoteState {
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint64_t mtime = 0;
    };

    std::mutex mtx; // protects nodes
    std::map<std::string, Node> nodes; // absolute path -> node
    std::string home = "/home/alice";

    // Behavior
    std::size_t chunkSize = 32 * 1024;
    std::chrono::milliseconds connectDelay{0};
    std::string connectError;            // non-empty: connect fails with it
    std::size_t failAfterBytes = 0;      // non-zero: get/put fail past this
    std::function<void()> onChunk;       // runs before every chunk
    std::set<std::string> unreadable;    // stat works, opening for read fails
    // Host key missing from known_hosts: AcceptNew asks hostkey_confirm_cb.
    bool unknownHostKey = false;

    // Observations
    std::atomic<int> connectAttempts{0};
    std::atomic<int> disconnects{0};
};

class MockSftpClient : public SftpClient {
public:
    // Seeds a small tree: /, /home, /home/alice, /var, /var/log and a few files.
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemoteState> state);

    std::shared_ptr<MockRemoteState> state() const { return state_; }

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }

    bool realPath(const std::string& remote_path,
                  std::string& out,
                  std::string& err) override;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err,
             StepCB step = {},
             CancelCB shouldCancel = {}) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err,
             StepCB step = {},
             CancelCB shouldCancel = {}) override;

    bool readFile(const std::string& remote,
                  std::string& out,
                  std::string& err) override;

    bool writeFile(const std::string& remote,
                   const std::string& content,
                   std::string& err) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err,
                bool overwrite = false) override;

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                  std::string& err) override;

    // Drop the session as if the server went away (pool staleness tests).
    void simulateDrop() { connected_ = false; }

private:
    std::shared_ptr<MockRemoteState> state_;
    std::atomic<bool> connected_{false};
    SessionOptions lastOpt_{};

    std::string resolve(const std::string& path) const;
    bool requireConnected(std::string& err) const;
};

} // namespace ferry
